#include "NumericConfig.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

NumericConfig::Backend NumericConfig::parse_backend(const std::string& name) {
    const std::string key = StringUtils::to_lower(name);
    if (key == "double") {
        return Backend::Double;
    } else if (key == "mpfr") {
        return Backend::Mpfr;
    }
    throw std::runtime_error("Invalid numeric backend: " + name + " (expected double or mpfr)");
}

std::string NumericConfig::backend_to_string(Backend backend) {
    switch (backend) {
        case Backend::Double: return "double";
        case Backend::Mpfr:   return "mpfr";
        default:              return "unknown";
    }
}
