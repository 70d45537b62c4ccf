#pragma once
#include <stdexcept>
#include <string>

// Durable store I/O failure. Never swallowed: a lost claim or update breaks at-least-once delivery.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Unresolvable operation, invalid workflow definition, bad environment value.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Raised by agent operations. Non-retryable failures skip the remaining retry budget.
class HandlerError : public std::runtime_error {
public:
    explicit HandlerError(const std::string& what, bool retryable = true)
        : std::runtime_error(what), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

// A wait budget elapsed. The underlying tasks keep running.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};
