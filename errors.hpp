#pragma once

#include <stdexcept>
#include <string>

namespace live_proxy {

// Raised while loading or validating configuration, before anything runs.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// An operation could not be started or performed. Distinct from an
// operation that ran and reported Outcome::Failure.
class OperationError : public std::runtime_error {
public:
    explicit OperationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace live_proxy
