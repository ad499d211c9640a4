#pragma once

#include <stdexcept>
#include <string>

namespace fileops::engine {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UnsupportedOperation : Error {
    explicit UnsupportedOperation(const std::string& kind)
        : Error("operation type " + kind + " not supported"), kind(kind) {}

    std::string kind;
};

struct InvalidConfiguration : Error {
    explicit InvalidConfiguration(const std::string& reason)
        : Error("configuration validation failed: " + reason), reason(reason) {}

    std::string reason;
};

struct ConcurrencyLimitExceeded : Error {
    explicit ConcurrencyLimitExceeded(const unsigned int limit)
        : Error("maximum concurrent operations limit reached (" + std::to_string(limit) + ")"), limit(limit) {}

    unsigned int limit;
};

struct OperationNotFound : Error {
    explicit OperationNotFound(const std::string& id)
        : Error("operation " + id + " not found or not active"), id(id) {}

    std::string id;
};

}
