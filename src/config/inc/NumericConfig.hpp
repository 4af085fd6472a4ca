#pragma once
#include <string>

struct NumericConfig {
    enum class Backend {
        Double,
        Mpfr
    } backend = Backend::Mpfr;

    int dps = 15;    // significant decimal digits, mpfr backend only

    static Backend parse_backend(const std::string& name);
    static std::string backend_to_string(Backend backend);
};
