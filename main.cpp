#include "bootstrap_config.hpp"
#include "logger.hpp"
#include "error_manager.hpp"
#include "nlp.hpp"
#include "nlp_rules.hpp"
#include "ai.hpp"
#include "intent_resolver.hpp"
#include "context.hpp"
#include "context_store.hpp"
#include "commands.hpp"
#include "response_manager.hpp"
#include "orchestrator.hpp"
#include "scheduler/scheduler.hpp"
#include "scheduler/timer_queue.hpp"
#include "scheduler/job_store.hpp"
#include "reminders/reminders.hpp"
#include "voice/voice.hpp"
#include "voice/voice_speak.hpp"

#include <iostream>
#include <fstream>
#include <iterator>
#include <sstream>
#include <set>
#include <chrono>

namespace {

// "user: text" -> {user, text}; a line without ':' is spoken by "default"
std::pair<std::string, std::string> splitUserLine(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos) return {"default", trimCopy(line)};

    std::string user = trimCopy(line.substr(0, colon));
    std::string text = trimCopy(line.substr(colon + 1));
    if (user.empty() || user.find(' ') != std::string::npos) return {"default", trimCopy(line)};
    return {user, text};
}

void printJson(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

// ------------------------------------------------------------
// Console commands
//   /device <user> <token> [device_id]
//   /remind <user> <iso-time> <text...>
//   /reminders <user>
//   /cancel <job_id>
//   /audio <user> <file.wav>
// ------------------------------------------------------------
void handleConsoleCommand(const std::string& line,
                          Orchestrator& orchestrator,
                          ReminderService& reminders,
                          DeviceRegistry& devices) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;

    if (cmd == "/device") {
        std::string user, token, deviceId;
        in >> user >> token >> deviceId;
        if (deviceId.empty()) deviceId = "console";

        auto reg = devices.registerDevice(user, token, deviceId, "console");
        if (!reg.success) {
            std::cout << ErrorManager::getUserMessage(reg.errorCode) << std::endl;
            return;
        }
        printJson({{"registration_id", reg.registrationId},
                   {"expires_at", formatIsoUtc(reg.expiresAt)}});
    } else if (cmd == "/remind") {
        std::string user, when, text;
        in >> user >> when;
        std::getline(in, text);

        auto res = reminders.scheduleReminder(user, "", trimCopy(text), when);
        if (!res.success) {
            std::cout << res.message << std::endl;
            return;
        }
        printJson(jobToJson(res.job));
    } else if (cmd == "/reminders") {
        std::string user;
        in >> user;

        nlohmann::json list = nlohmann::json::array();
        for (const auto& job : reminders.listReminders(user)) list.push_back(jobToJson(job));
        printJson(list);
    } else if (cmd == "/cancel") {
        std::string jobId;
        in >> jobId;

        auto res = reminders.cancelReminder(jobId);
        std::cout << (res.cancelledPending ? "Cancelled " : "Nothing pending for ") << jobId << std::endl;
    } else if (cmd == "/audio") {
        std::string user, file;
        in >> user >> file;

        std::ifstream f(file, std::ios::binary);
        if (!f) {
            std::cout << "Cannot open " << file << std::endl;
            return;
        }
        ConversationRequest request;
        request.userId = user;
        request.audio = std::vector<std::uint8_t>((std::istreambuf_iterator<char>(f)),
                                                  std::istreambuf_iterator<char>());
        printJson(orchestrator.processConversation(request).toJson());
    } else {
        std::cout << "Unknown command: " << cmd << std::endl;
    }
}

} // namespace

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : bootstrap_config::kConfigFile;

    // Logger first so config problems are recorded
    initLogger("jarvis.log");
    LOG_PHASE("Startup begin", true);

    nlohmann::json config;
    bootstrap_config::loadConfig(configPath, bootstrap_config::defaultAssistant(), config,
                                 "assistant_config.json", "ERR_CONFIG_INVALID");
    setLogLevel(parseLogLevel(config.value("log_level", "info")));

    if (!ErrorManager::load(config.value("errors_file", "errors.json"))) {
        LOG_WARN("Config", "Using built-in error table");
    }

    const auto& aiCfg = config["ai"];
    const auto& nlpCfg = config["nlp"];
    const auto& ctxCfg = config["context"];

    // ------------------------------------------------------------
    // Intent resolution
    // ------------------------------------------------------------
    NLP nlp;
    loadNlpRules(nlp, nlpCfg.value("rules_file", ""));

    std::set<std::string> cities;
    for (auto& [city, code] : config["flights"]["airports"].items()) cities.insert(toLowerAscii(city));
    nlp.setKnownCities(cities);

    auto completion = std::make_shared<HttpCompletionClient>(aiCfg);
    LOG_INFO("AI", "Completion backend: " + completion->resolveBackend());

    ResolverOptions resolverOpts;
    resolverOpts.acceptThreshold = nlpCfg.value("accept_threshold", 0.8);
    resolverOpts.fallbackDefaultConfidence = nlpCfg.value("fallback_confidence", 0.7);
    resolverOpts.fallbackTemperature = aiCfg.value("intent_temperature", 0.3);
    resolverOpts.fallbackMaxTokens = aiCfg.value("intent_max_tokens", 200);
    resolverOpts.fallbackTimeout = std::chrono::milliseconds(aiCfg.value("intent_timeout_ms", 10000));
    auto resolver = std::make_shared<IntentResolver>(std::move(nlp), completion, resolverOpts);
    LOG_PHASE("Intent resolver ready", true);

    // ------------------------------------------------------------
    // Context
    // ------------------------------------------------------------
    auto contextStore = std::make_shared<JsonFileContextStore>(
        ctxCfg.value("store_file", "memory.json"),
        ctxCfg.value("max_turns_per_user", 200));

    ContextOptions ctxOpts;
    ctxOpts.recentTurnLimit = ctxCfg.value("recent_turns", 5);
    ctxOpts.defaultPreferences = ctxCfg.value("default_preferences", defaultPreferences());
    auto context = std::make_shared<ContextProvider>(contextStore, ctxOpts);
    LOG_PHASE("Context store ready", true);

    // ------------------------------------------------------------
    // Scheduling + push delivery
    // ------------------------------------------------------------
    auto timers = std::make_shared<TimerQueue>();
    auto jobStore = std::make_shared<JsonFileJobStore>(config["scheduler"].value("store_file", "jobs.json"));
    auto engine = std::make_shared<SchedulingEngine>(timers, jobStore);

    const auto& pushCfg = config["push"];
    ReminderOptions reminderOpts;
    reminderOpts.alarmTitle = pushCfg.value("alarm_title", reminderOpts.alarmTitle);
    reminderOpts.reminderTitle = pushCfg.value("reminder_title", reminderOpts.reminderTitle);

    auto devices = std::make_shared<DeviceRegistry>();
    auto reminders = std::make_shared<ReminderService>(
        engine, std::make_shared<HttpPushSender>(pushCfg), devices, reminderOpts);
    reminders->attach();

    std::size_t rearmed = engine->restore();
    LOG_PHASE("Scheduler restored (" + std::to_string(rearmed) + " pending)", true);

    // ------------------------------------------------------------
    // Actions
    // ------------------------------------------------------------
    std::map<std::string, std::string> airports;
    for (auto& [city, code] : config["flights"]["airports"].items()) {
        if (code.is_string()) airports[toLowerAscii(city)] = code.get<std::string>();
    }

    CommandServices services;
    services.alarms = std::make_shared<AlarmService>(engine);
    services.flights = std::make_shared<FlightsService>(
        std::make_shared<CatalogueFlightSearch>(defaultFlightCatalogue()), airports);

    auto router = std::make_shared<CommandRouter>();
    initCommands(*router, services);
    LOG_PHASE("Commands registered", true);

    SynthesizerOptions synthOpts;
    synthOpts.temperature = aiCfg.value("response_temperature", 0.7);
    synthOpts.maxTokens = aiCfg.value("response_max_tokens", 150);
    synthOpts.timeout = std::chrono::milliseconds(aiCfg.value("response_timeout_ms", 10000));
    auto synthesizer = std::make_shared<ResponseSynthesizer>(completion, synthOpts);

    // ------------------------------------------------------------
    // Voice
    // ------------------------------------------------------------
    const auto& voiceCfg = config["voice"];
    auto stt = std::make_shared<Voice::WhisperTranscriber>(voiceCfg);
    std::shared_ptr<Voice::TextToSpeech> tts;
    auto commandTts = std::make_shared<Voice::CommandTextToSpeech>(voiceCfg);
    if (commandTts->enabled()) {
        tts = commandTts;
        LOG_PHASE("TTS command configured", true);
    } else {
        LOG_DEBUG("Voice", "No tts_command configured, replies are text only");
    }

    Orchestrator orchestrator(resolver, context, router, synthesizer, stt, tts);
    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        line = trimCopy(line);
        if (line.empty()) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        if (line.front() == '/') {
            handleConsoleCommand(line, orchestrator, *reminders, *devices);
            continue;
        }

        auto [user, text] = splitUserLine(line);
        LOG_TRACE("Console", "Dispatching for " + user + ": " + text);

        ConversationRequest request;
        request.userId = user;
        request.text = text;
        printJson(orchestrator.processConversation(request).toJson());
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    engine->shutdown();
    timers->shutdown();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
