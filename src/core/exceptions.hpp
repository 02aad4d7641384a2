#pragma once

#include <stdexcept>
#include <string>

namespace xvh {

class XvhException : public std::runtime_error {
public:
    explicit XvhException(const std::string& message) : std::runtime_error(message) {}
    explicit XvhException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public XvhException {
public:
    explicit ConfigurationError(const std::string& message)
        : XvhException("Configuration Error: " + message) {}
};

class DatabaseError : public XvhException {
public:
    explicit DatabaseError(const std::string& message)
        : XvhException("Database Error: " + message) {}
};

class ValidationError : public XvhException {
public:
    explicit ValidationError(const std::string& message)
        : XvhException("Validation Error: " + message) {}
};

class InvalidPriceError : public XvhException {
public:
    explicit InvalidPriceError(const std::string& message)
        : XvhException("Invalid Price: " + message) {}
};

// Raised for malformed internal calls; never recovered from.
class InvalidAmountError : public XvhException {
public:
    explicit InvalidAmountError(const std::string& message)
        : XvhException("Invalid Amount: " + message) {}
};

class InsufficientFundsError : public XvhException {
public:
    explicit InsufficientFundsError(const std::string& message)
        : XvhException("Insufficient Funds: " + message) {}
};

class InsufficientHoldingError : public XvhException {
public:
    explicit InsufficientHoldingError(const std::string& message)
        : XvhException("Insufficient Holding: " + message) {}
};

} // namespace xvh
