#pragma once

#include "config.hpp"
#include "oracle/model_transport.hpp"

#include <string>

// Anthropic Messages API or an OpenAI-compatible chat-completions endpoint.
class HttpModelTransport : public ModelTransport {
public:
    explicit HttpModelTransport(Config::Oracle config);
    ~HttpModelTransport() override;

    HttpModelTransport(const HttpModelTransport&) = delete;
    HttpModelTransport& operator=(const HttpModelTransport&) = delete;

    std::expected<std::string, OracleError> complete(const std::string& prompt) override;

private:
    Config::Oracle config_;
};
