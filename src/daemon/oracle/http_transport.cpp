#include "oracle/http_transport.hpp"
#include "text/utf8.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpModelTransport::HttpModelTransport(Config::Oracle config)
    : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpModelTransport::~HttpModelTransport() {
    curl_global_cleanup();
}

std::expected<std::string, OracleError> HttpModelTransport::complete(const std::string& prompt) {
    std::string api_key;
    if (!config_.api_key_env.empty()) {
        if (const char* v = std::getenv(config_.api_key_env.c_str())) api_key = v;
    }

    bool openai = config_.api_format == "openai";

    std::string endpoint;
    json body;
    if (openai) {
        endpoint = config_.url + "/v1/chat/completions";
        body = {
            {"model", config_.model},
            {"max_tokens", config_.max_tokens},
            {"temperature", 0},
            {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
        };
    } else {
        endpoint = config_.url + "/v1/messages";
        body = {
            {"model", config_.model},
            {"max_tokens", config_.max_tokens},
            {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
        };
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(OracleError{OracleError::Kind::Transport, "curl_easy_init failed"});
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (openai) {
        if (!api_key.empty()) {
            headers = curl_slist_append(headers, ("Authorization: Bearer " + api_key).c_str());
        }
    } else {
        headers = curl_slist_append(headers, ("x-api-key: " + api_key).c_str());
        headers = curl_slist_append(headers, "anthropic-version: 2023-06-01");
    }

    // Terminal output is not guaranteed to be valid UTF-8.
    std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(OracleError{OracleError::Kind::Timeout,
            std::format("no response within {}s", config_.timeout_seconds)});
    }
    if (res != CURLE_OK) {
        return std::unexpected(OracleError{OracleError::Kind::Transport,
            std::string("curl error: ") + curl_easy_strerror(res)});
    }
    if (http_code / 100 != 2) {
        return std::unexpected(OracleError{OracleError::Kind::Transport,
            std::format("HTTP {}: {}", http_code, utf8::head(response_body, 200))});
    }

    try {
        auto j = json::parse(response_body);

        if (openai) {
            auto& choices = j.at("choices");
            if (choices.empty()) {
                return std::unexpected(OracleError{OracleError::Kind::Parse, "response has no choices"});
            }
            return choices[0].at("message").at("content").get<std::string>();
        }

        std::string text;
        for (auto& block : j.at("content")) {
            if (block.value("type", "") == "text") text += block.value("text", "");
        }
        return text;
    } catch (const json::exception& e) {
        return std::unexpected(OracleError{OracleError::Kind::Parse,
            std::string("JSON parse error: ") + e.what()});
    }
}
