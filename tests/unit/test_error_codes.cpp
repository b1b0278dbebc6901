#include <catch2/catch_test_macros.hpp>

#include "LLMErrors.hpp"

#include <chrono>
#include <string>

TEST_CASE("Catalog entries carry a message and a resolution") {
    const auto info = ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::NETWORK_TIMEOUT, "POST /messages");
    REQUIRE(info.code == ErrorCodes::Code::NETWORK_TIMEOUT);
    REQUIRE(info.message == "The request timed out.");
    REQUIRE_FALSE(info.resolution.empty());
    REQUIRE(info.get_user_message().rfind("The request timed out. ", 0) == 0);

    const std::string details = info.get_full_details();
    REQUIRE(details.find("Error Code: 1002") != std::string::npos);
    REQUIRE(details.find("Details: POST /messages") != std::string::npos);
}

TEST_CASE("Typed errors map to their catalog codes") {
    REQUIRE(AuthError("openai", 401, "bad key").get_error_code() ==
            ErrorCodes::Code::API_AUTHENTICATION_FAILED);
    REQUIRE(AuthError("openai", 403, "forbidden").get_error_code() ==
            ErrorCodes::Code::API_INSUFFICIENT_PERMISSIONS);
    REQUIRE(HttpError(429, "slow").get_error_code() == ErrorCodes::Code::API_RATE_LIMIT_EXCEEDED);
    REQUIRE(HttpError(503, "down").get_error_code() == ErrorCodes::Code::API_SERVER_ERROR);
    REQUIRE(HttpError(422, "bad").get_error_code() == ErrorCodes::Code::API_INVALID_REQUEST);
    REQUIRE(HttpError(302, "moved").get_error_code() == ErrorCodes::Code::API_REQUEST_FAILED);
    REQUIRE(TimeoutError("late", std::chrono::milliseconds(250)).get_error_code() ==
            ErrorCodes::Code::NETWORK_TIMEOUT);
    REQUIRE(ParseError("broken").get_error_code() == ErrorCodes::Code::API_RESPONSE_PARSE_ERROR);
}

TEST_CASE("User messages keep the specific text and add the resolution") {
    const AuthError error("anthropic", 401, "invalid x-api-key");
    REQUIRE(std::string(error.what()) == "invalid x-api-key");
    REQUIRE(error.get_user_message() == "invalid x-api-key Check your API key for this provider.");
    REQUIRE(error.get_full_details().find("provider: anthropic") != std::string::npos);

    const TimeoutError timeout("Request timed out after 250 ms", std::chrono::milliseconds(250));
    REQUIRE(timeout.timeout() == std::chrono::milliseconds(250));
    REQUIRE(timeout.get_full_details().find("timeout: 250 ms") != std::string::npos);
}

TEST_CASE("Typed errors are catchable as AppException") {
    try {
        throw NetworkError(ErrorCodes::Code::NETWORK_CONNECTION_FAILED, "Couldn't connect to server");
    } catch (const ErrorCodes::AppException& ex) {
        REQUIRE(ex.get_error_code_int() == 1001);
    }
}

TEST_CASE("AppException without a custom message uses the catalog text") {
    const ErrorCodes::AppException ex(ErrorCodes::Code::STREAM_INTERRUPTED, "after 3 chunks");
    REQUIRE(std::string(ex.what()) == "The response stream was interrupted.");
    REQUIRE(ex.get_error_info().technical_details == "after 3 chunks");
    REQUIRE(ex.get_user_message() ==
            "The response stream was interrupted. Check your network connection and try again.");
}
