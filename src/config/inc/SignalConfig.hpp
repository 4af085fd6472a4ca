#pragma once
#include "SignalType.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SignalConfig {
    std::string name;
    SignalType type = SignalType::Square;

    // Decimal text, parsed by the numeric context at its own precision
    std::string amplitude = "1";
    std::string period = "1";

    struct Range {
        std::string start = "0";
        std::string stop = "1";
        size_t count = 11;
    };

    // Exactly one of times / range describes the time values
    std::vector<std::string> times;
    std::optional<Range> range;

    std::string display_name() const {
        return name.empty() ? SignalTypeUtils::to_string(type) : name;
    }
};
