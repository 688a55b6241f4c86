#ifndef GEOMILL_COMMON_ERROR_HPP
#define GEOMILL_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace geomill {

// Base of every failure the dispatcher knows how to report
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}

    // Short class name used in log lines
    virtual const char* kind() const noexcept { return "error"; }
};

// Malformed boundary data (null pointers, bad counts, duplicate keys)
class DecodeError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "decode"; }
};

// Missing or unknown command
class DispatchError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "dispatch"; }
};

// A config value is missing, malformed or out of range
class ValidationError : public Error {
public:
    ValidationError(std::string key, const std::string& message)
        : Error(message), key_(std::move(key)) {}

    const std::string& key() const { return key_; }
    const char* kind() const noexcept override { return "validation"; }

private:
    std::string key_;
};

// An operation failed while running its algorithm
class ExecutionError : public Error {
public:
    using Error::Error;
    const char* kind() const noexcept override { return "execution"; }
};

}  // namespace geomill

#endif // GEOMILL_COMMON_ERROR_HPP
