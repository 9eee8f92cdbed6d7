#pragma once

#include "interfaces.hpp"

#include <mutex>
#include <string>

namespace pushscribe {

// OpenAI chat completions: the instruction goes in as the system message,
// the transcript as the user message. Never retries.
class ChatTransformer : public TextTransformer {
public:
    static constexpr const char* DEFAULT_ENDPOINT = "https://api.openai.com/v1/chat/completions";

    explicit ChatTransformer(std::string api_key,
                             std::string model = "gpt-4o-mini",
                             std::string endpoint = DEFAULT_ENDPOINT);

    TransformResult transform(const std::string& text, const std::string& instruction) override;

    // Reload swaps the key and model
    void set_api_key(const std::string& api_key);
    void set_model(const std::string& model);

    // Request/response handling, public for testing
    static std::string build_request_body(const std::string& model,
                                          const std::string& text,
                                          const std::string& instruction);
    static TransformResult parse_response(long http_status, const std::string& body);

private:
    mutable std::mutex mutex_;
    std::string api_key_;
    std::string model_;
    std::string endpoint_;
};

} // namespace pushscribe
