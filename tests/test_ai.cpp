#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "ai.hpp"

namespace {
    // Records reachability checks instead of making HTTP calls
    class OfflineCompletionClient : public HttpCompletionClient {
    public:
        using HttpCompletionClient::HttpCompletionClient;

        mutable std::atomic<int> checks{0};
        mutable std::vector<std::string> urls;
        bool reachable = false;

    protected:
        bool backendReachable(const std::string& url) const override {
            checks++;
            urls.push_back(url);
            return reachable;
        }
    };
}

TEST(HttpCompletionClient, AutoBackendIsResolvedOnce) {
    OfflineCompletionClient client(nlohmann::json{{"backend", "auto"}});

    for (int i = 0; i < 2; i++) {
        CompletionResult r = client.complete("system", "hello", 0.3, 32, CompletionOptions{});
        EXPECT_FALSE(r.success);
        EXPECT_EQ(r.error, "missing OpenAI API key");
    }

    // ollama, then localai, on the first call only
    EXPECT_EQ(client.checks.load(), 2);
    ASSERT_EQ(client.urls.size(), 2u);
    EXPECT_EQ(client.urls[0], "http://127.0.0.1:11434/api/tags");
    EXPECT_EQ(client.urls[1], "http://127.0.0.1:8080/v1/models");
    EXPECT_EQ(client.resolveBackend(), "openai");
    EXPECT_EQ(client.checks.load(), 2);
}

TEST(HttpCompletionClient, ReachableOllamaWins) {
    OfflineCompletionClient client(nlohmann::json{{"backend", "auto"}, {"ollama_url", "http://gpu-box:11434"}});
    client.reachable = true;

    EXPECT_EQ(client.resolveBackend(), "ollama");
    EXPECT_EQ(client.resolveBackend(), "ollama");
    EXPECT_EQ(client.checks.load(), 1);
    EXPECT_EQ(client.urls[0], "http://gpu-box:11434/api/tags");
}

TEST(HttpCompletionClient, ExplicitBackendSkipsChecks) {
    OfflineCompletionClient client(nlohmann::json{{"backend", "openai"}});
    EXPECT_EQ(client.resolveBackend(), "openai");

    OfflineCompletionClient bogus(nlohmann::json{{"backend", "carrier_pigeon"}});
    CompletionResult r = bogus.complete("system", "hello", 0.3, 32, CompletionOptions{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "unknown backend: carrier_pigeon");

    EXPECT_EQ(client.checks.load(), 0);
    EXPECT_EQ(bogus.checks.load(), 0);
}

TEST(CompleteWithTimeout, MissingClientFails) {
    CompletionResult r = completeWithTimeout(nullptr, "system", "hello", 0.3, 32, CompletionOptions{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "no completion backend configured");
}

TEST(StripCodeFences, RemovesJsonFence) {
    EXPECT_EQ(stripCodeFences("```json\n{\"intent\": \"greeting\"}\n```"), "{\"intent\": \"greeting\"}\n");
    EXPECT_EQ(stripCodeFences("{\"a\": 1}"), "{\"a\": 1}");
    EXPECT_EQ(stripCodeFences("```unterminated"), "```unterminated");
}
