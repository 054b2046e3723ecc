#include "ai.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <future>
#include <thread>

// =========================================================
// Helpers
// =========================================================
std::string stripCodeFences(const std::string& text) {
    std::string out = text;
    auto start = out.find("```");
    if (start == std::string::npos) return out;

    auto bodyStart = out.find('\n', start);
    auto end = out.rfind("```");
    if (bodyStart == std::string::npos || end <= bodyStart) return out;
    return out.substr(bodyStart + 1, end - bodyStart - 1);
}

CompletionResult completeWithTimeout(const std::shared_ptr<CompletionClient>& client,
                                     const std::string& systemPrompt,
                                     const std::string& userPrompt,
                                     double temperature,
                                     int maxTokens,
                                     const CompletionOptions& options) {
    CompletionResult failed;
    if (!client) {
        failed.error = "no completion backend configured";
        return failed;
    }

    auto promise = std::make_shared<std::promise<CompletionResult>>();
    std::future<CompletionResult> future = promise->get_future();

    // Detached so a hung backend cannot block the caller past the timeout
    std::thread([client, promise, systemPrompt, userPrompt, temperature, maxTokens, options]() {
        CompletionResult result;
        try {
            result = client->complete(systemPrompt, userPrompt, temperature, maxTokens, options);
        } catch (const std::exception& e) {
            result.success = false;
            result.error = std::string("backend exception: ") + e.what();
        }
        promise->set_value(std::move(result));
    }).detach();

    if (future.wait_for(options.timeout) != std::future_status::ready) {
        LOG_WARN("AI", "Completion timed out after " + std::to_string(options.timeout.count()) + " ms");
        failed.error = "timeout";
        return failed;
    }
    return future.get();
}

// =========================================================
// HttpCompletionClient
// =========================================================
HttpCompletionClient::HttpCompletionClient(nlohmann::json aiConfig)
    : config_(std::move(aiConfig)) {
    if (!config_.is_object()) config_ = nlohmann::json::object();
}

bool HttpCompletionClient::backendReachable(const std::string& url) const {
    auto r = cpr::Get(cpr::Url{url}, cpr::Timeout{1000});
    return r.status_code == 200;
}

std::string HttpCompletionClient::resolveBackend() const {
    std::string backend = config_.value("backend", "auto");
    if (backend != "auto") return backend;

    std::lock_guard<std::mutex> lock(backendMutex_);
    if (resolvedBackend_) return *resolvedBackend_;

    if (backendReachable(config_.value("ollama_url", "http://127.0.0.1:11434") + "/api/tags")) {
        backend = "ollama";
    } else if (backendReachable(config_.value("localai_url", "http://127.0.0.1:8080/v1") + "/models")) {
        backend = "localai";
    } else {
        backend = "openai";
    }
    LOG_INFO("AI", "Auto-selected backend: " + backend);
    resolvedBackend_ = backend;
    return backend;
}

CompletionResult HttpCompletionClient::complete(const std::string& systemPrompt,
                                                const std::string& userPrompt,
                                                double temperature,
                                                int maxTokens,
                                                const CompletionOptions& options) {
    std::string backend = resolveBackend();
    LOG_DEBUG("AI", "complete backend=" + backend + " model=" + config_.value("default_model", "mistral"));

    if (backend == "ollama") {
        return completeOllama(systemPrompt, userPrompt, temperature, maxTokens, options);
    }
    if (backend == "localai" || backend == "openai") {
        return completeChat(backend, systemPrompt, userPrompt, temperature, maxTokens, options);
    }

    CompletionResult result;
    result.error = "unknown backend: " + backend;
    LOG_ERROR("AI", result.error);
    return result;
}

CompletionResult HttpCompletionClient::completeOllama(const std::string& systemPrompt,
                                                      const std::string& userPrompt,
                                                      double temperature,
                                                      int maxTokens,
                                                      const CompletionOptions& options) const {
    CompletionResult result;

    nlohmann::json body = {
        {"model", config_.value("default_model", "mistral")},
        {"system", systemPrompt},
        {"prompt", userPrompt},
        {"stream", false},
        {"options", {{"temperature", temperature}, {"num_predict", maxTokens}}}
    };
    if (options.jsonResponse) body["format"] = "json";

    auto resp = cpr::Post(
        cpr::Url{config_.value("ollama_url", "http://127.0.0.1:11434") + "/api/generate"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{options.timeout}
    );

    if (resp.status_code != 200) {
        result.error = "ollama HTTP " + std::to_string(resp.status_code) + " " + resp.error.message;
        LOG_ERROR("AI", result.error);
        return result;
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded() || !j.contains("response")) {
        result.error = "ollama returned malformed JSON";
        LOG_ERROR("AI", result.error);
        return result;
    }

    result.success = true;
    result.text = j["response"].get<std::string>();
    return result;
}

CompletionResult HttpCompletionClient::completeChat(const std::string& backend,
                                                    const std::string& systemPrompt,
                                                    const std::string& userPrompt,
                                                    double temperature,
                                                    int maxTokens,
                                                    const CompletionOptions& options) const {
    CompletionResult result;

    std::string url =
        (backend == "localai")
            ? config_.value("localai_url", "http://127.0.0.1:8080/v1") + "/chat/completions"
            : config_.value("openai_url", "https://api.openai.com/v1") + "/chat/completions";

    cpr::Header headers = {{"Content-Type", "application/json"}};
    if (backend == "openai") {
        std::string apiKey;
        if (config_.contains("api_keys") && config_["api_keys"].is_object()) {
            apiKey = config_["api_keys"].value("openai", "");
        }
        if (apiKey.empty()) {
            result.error = "missing OpenAI API key";
            LOG_ERROR("AI", result.error);
            return result;
        }
        headers["Authorization"] = "Bearer " + apiKey;
    }

    nlohmann::json body = {
        {"model", config_.value("default_model", "mistral")},
        {"temperature", temperature},
        {"max_tokens", maxTokens},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", systemPrompt}},
            {{"role", "user"}, {"content", userPrompt}}
        })}
    };
    if (options.jsonResponse) body["response_format"] = {{"type", "json_object"}};

    auto resp = cpr::Post(cpr::Url{url}, headers, cpr::Body{body.dump()}, cpr::Timeout{options.timeout});

    if (resp.status_code != 200) {
        result.error = backend + " HTTP " + std::to_string(resp.status_code) + " " + resp.error.message;
        LOG_ERROR("AI", result.error);
        return result;
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded() || !j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        result.error = backend + " returned malformed JSON";
        LOG_ERROR("AI", result.error);
        return result;
    }

    const auto& message = j["choices"][0].value("message", nlohmann::json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        result.error = backend + " reply had no content";
        LOG_ERROR("AI", result.error);
        return result;
    }

    result.success = true;
    result.text = message["content"].get<std::string>();
    return result;
}
