#pragma once
#include <stdexcept>
#include <string>

class NumericError : public std::runtime_error {
public:
    explicit NumericError(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised by NumericContext::divide when the divisor is zero
class DivisionByZeroError : public NumericError {
public:
    explicit DivisionByZeroError(const std::string& msg = "division by zero") : NumericError(msg) {}
};

class NumericOverflowError : public NumericError {
public:
    explicit NumericOverflowError(const std::string& msg) : NumericError(msg) {}
};
