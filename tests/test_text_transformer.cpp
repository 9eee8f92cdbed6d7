// Automated tests for the chat completions request/response handling

#include "text_transformer.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <cassert>

using namespace pushscribe;
using json = nlohmann::json;

void test_request_body() {
    std::cout << "Testing request body..." << std::endl;

    std::string body = ChatTransformer::build_request_body(
        "gpt-4o-mini", "привет \"мир\"", "Translate into English");
    json j = json::parse(body);

    assert(j["model"] == "gpt-4o-mini");
    assert(j["messages"].size() == 2);
    assert(j["messages"][0]["role"] == "system");
    assert(j["messages"][0]["content"] == "Translate into English");
    assert(j["messages"][1]["role"] == "user");
    assert(j["messages"][1]["content"] == "привет \"мир\"");
    assert(j["max_tokens"] == 1000);

    std::cout << "  PASS" << std::endl;
}

void test_success_response() {
    std::cout << "Testing successful response..." << std::endl;

    const char* body = R"({
        "choices": [{"message": {"role": "assistant", "content": "  Hello world \n"}}]
    })";
    TransformResult r = ChatTransformer::parse_response(200, body);
    assert(r.success);
    assert(r.text == "Hello world");
    assert(r.error.empty());

    std::cout << "  PASS" << std::endl;
}

void test_error_responses() {
    std::cout << "Testing error responses..." << std::endl;

    TransformResult unauthorized = ChatTransformer::parse_response(
        401, R"({"error": {"message": "Incorrect API key provided"}})");
    assert(!unauthorized.success);
    assert(unauthorized.api_key_missing);
    assert(unauthorized.error.find("Incorrect API key") != std::string::npos);

    TransformResult bare_401 = ChatTransformer::parse_response(401, "Unauthorized");
    assert(!bare_401.success && bare_401.api_key_missing);

    TransformResult limited = ChatTransformer::parse_response(
        429, R"({"error": {"message": "Rate limit reached"}})");
    assert(!limited.success);
    assert(!limited.api_key_missing);
    assert(limited.error.find("429") != std::string::npos);

    TransformResult garbage = ChatTransformer::parse_response(200, "<html>");
    assert(!garbage.success && !garbage.error.empty());

    TransformResult no_choices = ChatTransformer::parse_response(200, R"({"choices": []})");
    assert(!no_choices.success);

    TransformResult empty = ChatTransformer::parse_response(
        200, R"({"choices": [{"message": {"content": "   "}}]})");
    assert(!empty.success);

    std::cout << "  PASS" << std::endl;
}

void test_missing_key_short_circuits() {
    std::cout << "Testing missing API key..." << std::endl;

    // Never reaches the network
    ChatTransformer transformer("", "gpt-4o-mini", "http://127.0.0.1:9/unused");
    TransformResult r = transformer.transform("hello", "Fix it");
    assert(!r.success);
    assert(r.api_key_missing);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Text Transformer Test Suite ===" << std::endl << std::endl;

    test_request_body();
    test_success_response();
    test_error_responses();
    test_missing_key_short_circuits();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
