#pragma once
#include <string>

enum class SignalType {
    Square,
    Triangle,
    Sawtooth,
    UnitTriangle,
    Sigmoid
};

class SignalTypeUtils {
public:
    // Accepts the short names and the *w aliases, case-insensitive
    static SignalType from_string(const std::string& name);
    static std::string to_string(SignalType type);

    // Square, triangle and sawtooth repeat with a period
    static bool is_periodic(SignalType type);

    static std::string accepted_names();
};
