#include <gtest/gtest.h>

#include "orchestrator.hpp"
#include "commands.hpp"
#include "context_store.hpp"
#include "error_manager.hpp"
#include "nlp_rules.hpp"
#include "fakes.hpp"

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::install(nlohmann::json::object());

        NLP nlp;
        nlp.load_rules(defaultNlpRules());
        std::set<std::string> cities;
        for (const auto& [city, code] : defaultAirportCodes()) cities.insert(city);
        nlp.setKnownCities(cities);

        llm_ = std::make_shared<test::FakeCompletion>(R"({"intent": "unknown", "confidence": 0.2})");
        resolver_ = std::make_shared<IntentResolver>(nlp, llm_);
        context_ = std::make_shared<ContextProvider>(std::make_shared<InMemoryContextStore>());

        timers_ = std::make_shared<test::ManualTimer>();
        engine_ = std::make_shared<SchedulingEngine>(timers_, nullptr, clock_.fn());

        CommandServices services;
        services.alarms = std::make_shared<AlarmService>(engine_, clock_.fn());
        services.flights = std::make_shared<FlightsService>(
            std::make_shared<CatalogueFlightSearch>(defaultFlightCatalogue()));
        router_ = std::make_shared<CommandRouter>();
        initCommands(*router_, services);

        synthesizer_ = std::make_shared<ResponseSynthesizer>(nullptr);
    }

    void TearDown() override {
        engine_->shutdown();
    }

    Orchestrator make(std::shared_ptr<Voice::SpeechToText> stt = nullptr,
                      std::shared_ptr<Voice::TextToSpeech> tts = nullptr) {
        return Orchestrator(resolver_, context_, router_, synthesizer_, std::move(stt), std::move(tts));
    }

    static ConversationRequest textRequest(const std::string& text) {
        ConversationRequest r;
        r.userId = "alice";
        r.text = text;
        return r;
    }

    test::FakeClock clock_;
    std::shared_ptr<test::FakeCompletion> llm_;
    std::shared_ptr<IntentResolver> resolver_;
    std::shared_ptr<ContextProvider> context_;
    std::shared_ptr<test::ManualTimer> timers_;
    std::shared_ptr<SchedulingEngine> engine_;
    std::shared_ptr<CommandRouter> router_;
    std::shared_ptr<ResponseSynthesizer> synthesizer_;
};

TEST_F(OrchestratorTest, SetAlarmEndToEnd) {
    Orchestrator orchestrator = make();
    ConversationResponse r = orchestrator.processConversation(textRequest("Set an alarm for 7 AM"));

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.intentKind, "set_alarm");
    EXPECT_DOUBLE_EQ(r.confidence, 0.9);
    EXPECT_EQ(r.textResponse, "Alarm set for 07:00 AM");
    EXPECT_EQ(r.data["status"], "success");
    EXPECT_EQ(r.data["alarm_time"], "2026-10-20T07:00:00Z");
    EXPECT_EQ(llm_->calls.load(), 0);

    EXPECT_EQ(engine_->listForUser("alice").size(), 1u);
    EXPECT_EQ(timers_->pendingCount(), 1u);
}

TEST_F(OrchestratorTest, MissingFlightSlotsAreListed) {
    Orchestrator orchestrator = make();
    ConversationResponse r = orchestrator.processConversation(textRequest("find flights to nowhere"));

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.intentKind, "search_flights");
    EXPECT_EQ(r.textResponse, "I need the following information: source city, destination city, travel date");
    EXPECT_EQ(r.data["status"], "missing_slots");
}

TEST_F(OrchestratorTest, FlightSearchUsesTemplate) {
    Orchestrator orchestrator = make();
    ConversationResponse r = orchestrator.processConversation(
        textRequest("find flights from delhi to bangalore on 25 dec 2025"));

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.textResponse, "I found 3 flights. The best option is SpiceJet at 19:00 for ₹6,800, 2h 35m duration.");
    EXPECT_EQ(r.data["count"], 3);
}

TEST_F(OrchestratorTest, UnmatchedTextGoesToClassifier) {
    Orchestrator orchestrator = make();
    ConversationResponse r = orchestrator.processConversation(textRequest("tell me a joke"));

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.intentKind, "unknown");
    EXPECT_EQ(r.textResponse, "I've processed your request.");
    EXPECT_EQ(llm_->calls.load(), 1);
}

TEST_F(OrchestratorTest, AudioIsTranscribed) {
    auto stt = std::make_shared<test::FakeStt>("set an alarm for 9 pm");
    Orchestrator orchestrator = make(stt);

    ConversationRequest request;
    request.userId = "alice";
    request.audio = std::vector<std::uint8_t>{'R', 'I', 'F', 'F'};

    ConversationResponse r = orchestrator.processConversation(request);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.intentKind, "set_alarm");
    EXPECT_EQ(r.textResponse, "Alarm set for 09:00 PM");
    EXPECT_EQ(stt->calls, 1);
}

TEST_F(OrchestratorTest, TextWinsOverAudio) {
    auto stt = std::make_shared<test::FakeStt>("delete my alarm");
    Orchestrator orchestrator = make(stt);

    ConversationRequest request = textRequest("Set an alarm for 7 AM");
    request.audio = std::vector<std::uint8_t>{'R', 'I', 'F', 'F'};

    ConversationResponse r = orchestrator.processConversation(request);
    EXPECT_EQ(r.intentKind, "set_alarm");
    EXPECT_EQ(stt->calls, 0);
}

TEST_F(OrchestratorTest, TranscriptionFailureApologises) {
    auto stt = std::make_shared<test::FakeStt>("", true);
    Orchestrator orchestrator = make(stt);

    ConversationRequest request;
    request.userId = "alice";
    request.audio = std::vector<std::uint8_t>{0, 1, 2};

    ConversationResponse r = orchestrator.processConversation(request);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.intentKind, "error");
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_EQ(r.textResponse,
              "I apologize, but I encountered an error processing your request. Please try again.");
    EXPECT_EQ(r.data["error_code"], "ERR_STT_FAILED");
    EXPECT_EQ(r.data["error"], "garbled audio");
}

TEST_F(OrchestratorTest, NoInputIsAnError) {
    Orchestrator orchestrator = make();
    ConversationRequest request;
    request.userId = "alice";

    ConversationResponse r = orchestrator.processConversation(request);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.intentKind, "error");
    EXPECT_EQ(r.data["error"], "Either 'text' or 'audio' must be provided");
}

TEST_F(OrchestratorTest, SpeechIsBase64Encoded) {
    auto tts = std::make_shared<test::FakeTts>();
    Orchestrator orchestrator = make(nullptr, tts);

    ConversationResponse r = orchestrator.processConversation(textRequest("Set an alarm for 7 AM"));
    ASSERT_EQ(tts->spoken.size(), 1u);
    EXPECT_EQ(tts->spoken[0], "Alarm set for 07:00 AM");

    nlohmann::json j = r.toJson();
    EXPECT_EQ(j["audio_response"], "UklGRg==");
    EXPECT_EQ(j["text_response"], "Alarm set for 07:00 AM");
    EXPECT_EQ(j["intent"], "set_alarm");
}

TEST_F(OrchestratorTest, NoSpeechWithoutTts) {
    Orchestrator orchestrator = make();
    nlohmann::json j = orchestrator.processConversation(textRequest("Set an alarm for 7 AM")).toJson();
    EXPECT_TRUE(j["audio_response"].is_null());
}

TEST_F(OrchestratorTest, TurnIsRecorded) {
    Orchestrator orchestrator = make();
    orchestrator.processConversation(textRequest("Set an alarm for 7 AM"));

    auto turns = context_->recentTurns("alice");
    ASSERT_EQ(turns.size(), 1u);
    EXPECT_EQ(turns[0].text, "Set an alarm for 7 AM");
    EXPECT_EQ(turns[0].intentKind, "set_alarm");
    EXPECT_EQ(turns[0].response, "Alarm set for 07:00 AM");
}

TEST_F(OrchestratorTest, RequiresCollaborators) {
    EXPECT_THROW(Orchestrator(nullptr, context_, router_, synthesizer_), std::invalid_argument);
    EXPECT_THROW(Orchestrator(resolver_, context_, nullptr, synthesizer_), std::invalid_argument);
}

TEST(Base64, Padding) {
    EXPECT_EQ(base64Encode({}), "");
    EXPECT_EQ(base64Encode({'M'}), "TQ==");
    EXPECT_EQ(base64Encode({'M', 'a'}), "TWE=");
    EXPECT_EQ(base64Encode({'M', 'a', 'n'}), "TWFu");
}
