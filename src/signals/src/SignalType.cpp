#include "SignalType.hpp"
#include "StringUtils.hpp"
#include <stdexcept>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, SignalType>& name_map() {
    static const std::unordered_map<std::string, SignalType> names = {
        {"square", SignalType::Square},
        {"squarew", SignalType::Square},
        {"triangle", SignalType::Triangle},
        {"trianglew", SignalType::Triangle},
        {"sawtooth", SignalType::Sawtooth},
        {"sawtoothw", SignalType::Sawtooth},
        {"unit_triangle", SignalType::UnitTriangle},
        {"sigmoid", SignalType::Sigmoid},
        {"sigmoidw", SignalType::Sigmoid},
    };
    return names;
}

}

SignalType SignalTypeUtils::from_string(const std::string& name) {
    std::string key = StringUtils::to_lower(name);
    StringUtils::trim(key);

    auto it = name_map().find(key);
    if (it == name_map().end()) {
        throw std::invalid_argument("Unknown signal type: '" + name + "' (expected one of: " + accepted_names() + ")");
    }
    return it->second;
}

std::string SignalTypeUtils::to_string(SignalType type) {
    switch (type) {
        case SignalType::Square:       return "square";
        case SignalType::Triangle:     return "triangle";
        case SignalType::Sawtooth:     return "sawtooth";
        case SignalType::UnitTriangle: return "unit_triangle";
        case SignalType::Sigmoid:      return "sigmoid";
        default:                       return "unknown";
    }
}

bool SignalTypeUtils::is_periodic(SignalType type) {
    return type == SignalType::Square
        || type == SignalType::Triangle
        || type == SignalType::Sawtooth;
}

std::string SignalTypeUtils::accepted_names() {
    return "square, triangle, sawtooth, unit_triangle, sigmoid";
}
