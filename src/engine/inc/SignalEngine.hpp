#pragma once
#include "NumericConfig.hpp"
#include "Sample.hpp"
#include "SignalConfig.hpp"
#include <vector>

// Picks the numeric context named by the configuration and runs each signal
class SignalEngine {
public:
    explicit SignalEngine(const NumericConfig& numeric);

    SampleSet run(const SignalConfig& signal) const;
    std::vector<SampleSet> run_all(const std::vector<SignalConfig>& signals) const;

private:
    NumericConfig numeric_;
};
