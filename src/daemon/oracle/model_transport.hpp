#pragma once

#include "errors.hpp"

#include <expected>
#include <string>

// The decision oracle: prompt in, raw model text out.
class ModelTransport {
public:
    virtual ~ModelTransport() = default;
    virtual std::expected<std::string, OracleError> complete(const std::string& prompt) = 0;
};
