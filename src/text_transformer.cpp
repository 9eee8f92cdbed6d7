#include "text_transformer.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace pushscribe {

using json = nlohmann::json;

namespace {

constexpr long REQUEST_TIMEOUT_SECONDS = 30;

size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t n = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), n);
    return n;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

ChatTransformer::ChatTransformer(std::string api_key, std::string model, std::string endpoint)
    : api_key_(std::move(api_key))
    , model_(std::move(model))
    , endpoint_(std::move(endpoint)) {
}

void ChatTransformer::set_api_key(const std::string& api_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    api_key_ = api_key;
}

void ChatTransformer::set_model(const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = model;
}

std::string ChatTransformer::build_request_body(const std::string& model,
                                                const std::string& text,
                                                const std::string& instruction) {
    json body;
    body["model"] = model;
    body["messages"] = json::array({
        {{"role", "system"}, {"content", instruction}},
        {{"role", "user"}, {"content", text}},
    });
    body["max_tokens"] = 1000;
    body["temperature"] = 0.3;  // Consistent rewrites
    return body.dump();
}

TransformResult ChatTransformer::parse_response(long http_status, const std::string& body) {
    TransformResult result;

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        result.api_key_missing = (http_status == 401);
        result.error = "Invalid response (HTTP " + std::to_string(http_status) + "): " + e.what();
        return result;
    }

    if (http_status != 200) {
        std::string message = "HTTP " + std::to_string(http_status);
        auto err = j.find("error");
        if (err != j.end() && err->is_object()) {
            auto msg = err->find("message");
            if (msg != err->end() && msg->is_string()) {
                message += ": " + msg->get<std::string>();
            }
        }
        result.api_key_missing = (http_status == 401);
        result.error = message;
        return result;
    }

    try {
        const json& content = j.at("choices").at(0).at("message").at("content");
        result.text = trim(content.get<std::string>());
    } catch (const json::exception& e) {
        result.error = std::string("Unexpected response: ") + e.what();
        return result;
    }

    if (result.text.empty()) {
        result.error = "Empty response";
        return result;
    }

    result.success = true;
    return result;
}

TransformResult ChatTransformer::transform(const std::string& text, const std::string& instruction) {
    std::string api_key;
    std::string model;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        api_key = api_key_;
        model = model_;
    }

    if (api_key.empty()) {
        TransformResult result;
        result.api_key_missing = true;
        result.error = "OpenAI API key is not set";
        return result;
    }

    ensure_curl_global_init();

    CURL* curl = curl_easy_init();
    if (!curl) {
        TransformResult result;
        result.error = "Failed to initialize libcurl";
        return result;
    }

    std::string request = build_request_body(model, text, instruction);
    std::string response;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, ("Authorization: Bearer " + api_key).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, REQUEST_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (code != CURLE_OK) {
        TransformResult result;
        result.error = std::string("Request failed: ") + curl_easy_strerror(code);
        std::cerr << "Text transform: " << result.error << std::endl;
        return result;
    }

    TransformResult result = parse_response(http_status, response);
    if (result.success) {
        std::cout << "Text transform [" << model << "]: \"" << result.text << "\"" << std::endl;
    } else {
        std::cerr << "Text transform failed: " << result.error << std::endl;
    }
    return result;
}

} // namespace pushscribe
