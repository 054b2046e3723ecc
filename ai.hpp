#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// Generative completion seam
// ------------------------------------------------------------
struct CompletionOptions {
    bool jsonResponse = false;                         // "respond as JSON" hint
    std::chrono::milliseconds timeout{15000};          // caller-supplied bound
};

struct CompletionResult {
    bool success = false;
    std::string text;
    std::string error;
};

class CompletionClient {
public:
    virtual ~CompletionClient() = default;

    // Must not throw for backend failures; report them in the result.
    virtual CompletionResult complete(const std::string& systemPrompt,
                                      const std::string& userPrompt,
                                      double temperature,
                                      int maxTokens,
                                      const CompletionOptions& options) = 0;
};

// Run `client.complete` on a detached worker and wait at most
// options.timeout. A late reply is discarded; any exception or the
// timeout becomes a failed CompletionResult.
CompletionResult completeWithTimeout(const std::shared_ptr<CompletionClient>& client,
                                     const std::string& systemPrompt,
                                     const std::string& userPrompt,
                                     double temperature,
                                     int maxTokens,
                                     const CompletionOptions& options);

// Strip ``` fences an LLM may wrap around a JSON reply.
std::string stripCodeFences(const std::string& text);

// ------------------------------------------------------------
// HTTP backend (Ollama / LocalAI / OpenAI) via cpr
// ------------------------------------------------------------
class HttpCompletionClient : public CompletionClient {
public:
    // `aiConfig` is the "ai" section of assistant_config.json
    explicit HttpCompletionClient(nlohmann::json aiConfig);

    CompletionResult complete(const std::string& systemPrompt,
                              const std::string& userPrompt,
                              double temperature,
                              int maxTokens,
                              const CompletionOptions& options) override;

    // "ollama", "localai" or "openai". "auto" checks the local backends
    // once, on first use, and keeps the answer.
    std::string resolveBackend() const;

protected:
    // GET `url` with a 1 s timeout; true on HTTP 200.
    virtual bool backendReachable(const std::string& url) const;

private:
    CompletionResult completeOllama(const std::string& systemPrompt,
                                    const std::string& userPrompt,
                                    double temperature,
                                    int maxTokens,
                                    const CompletionOptions& options) const;

    CompletionResult completeChat(const std::string& backend,
                                  const std::string& systemPrompt,
                                  const std::string& userPrompt,
                                  double temperature,
                                  int maxTokens,
                                  const CompletionOptions& options) const;

    nlohmann::json config_;
    mutable std::mutex backendMutex_;
    mutable std::optional<std::string> resolvedBackend_;
};
