#include "DoubleContext.hpp"
#include <fmt/format.h>
#include <cmath>
#include <limits>
#include <stdexcept>

int DoubleContext::digits10() const {
    return std::numeric_limits<double>::digits10;
}

double DoubleContext::parse(const std::string& text) const {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number: '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid number: '" + text + "'");
    }
    return value;
}

std::string DoubleContext::to_string(const double& value) const {
    // Shortest representation that round-trips
    return fmt::format("{}", value);
}

double DoubleContext::floor(const double& x) const {
    return std::floor(x);
}

double DoubleContext::frac(const double& x) const {
    const double f = x - std::floor(x);
    return f < 1.0 ? f : std::nextafter(1.0, 0.0);
}

double DoubleContext::abs(const double& x) const {
    return std::fabs(x);
}

double DoubleContext::exp(const double& x) const {
    return std::exp(x);
}

double DoubleContext::divide(const double& num, const double& den) const {
    if (den == 0.0) {
        throw DivisionByZeroError();
    }
    return num / den;
}

const DoubleContext& DoubleContext::instance() {
    static const DoubleContext ctx{};
    return ctx;
}
