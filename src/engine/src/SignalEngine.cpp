#include "SignalEngine.hpp"
#include "DoubleContext.hpp"
#include "MpfrContext.hpp"
#include "SignalRunner.hpp"
#include "LogUtils.hpp"

SignalEngine::SignalEngine(const NumericConfig& numeric) : numeric_(numeric) {
    if (numeric_.backend == NumericConfig::Backend::Double && numeric_.dps != DoubleContext().digits10()) {
        LogUtils::warn("Backend double ignores dps={}; evaluating at host precision", numeric_.dps);
    }
}

SampleSet SignalEngine::run(const SignalConfig& signal) const {
    if (numeric_.backend == NumericConfig::Backend::Double) {
        return SignalRunner<double>(DoubleContext::instance(), signal).run();
    }

    const MpfrContext ctx(numeric_.dps);
    return SignalRunner<MpfrReal>(ctx, signal).run();
}

std::vector<SampleSet> SignalEngine::run_all(const std::vector<SignalConfig>& signals) const {
    std::vector<SampleSet> results;
    results.reserve(signals.size());
    for (const auto& signal : signals) {
        results.push_back(run(signal));
    }
    LogUtils::info("Evaluated {} signal(s)", results.size());
    return results;
}
