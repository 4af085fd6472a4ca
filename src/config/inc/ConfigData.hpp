#pragma once
#include "GlobalConfig.hpp"
#include "NumericConfig.hpp"
#include "OutputConfig.hpp"
#include "SignalConfig.hpp"
#include <vector>

struct ConfigData {
    GlobalConfig global;
    NumericConfig numeric;
    OutputConfig output;
    std::vector<SignalConfig> signals;
};
