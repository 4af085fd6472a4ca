#pragma once
#include "NumericContext.hpp"
#include "Sample.hpp"
#include "SignalConfig.hpp"
#include "SignalFunctions.hpp"
#include "LogUtils.hpp"
#include <stdexcept>
#include <vector>

// Evaluates one configured signal, one time value at a time
template <typename Real>
class SignalRunner {
public:
    SignalRunner(const NumericContext<Real>& ctx, const SignalConfig& config)
        : ctx_(ctx), config_(config),
          amplitude_(ctx.parse(config.amplitude)),
          period_(ctx.parse(config.period)) {}

    std::vector<Real> time_points() const {
        std::vector<Real> points;

        if (!config_.range) {
            points.reserve(config_.times.size());
            for (const auto& text : config_.times) {
                points.push_back(ctx_.parse(text));
            }
            return points;
        }

        const auto& range = *config_.range;
        if (range.count == 0) {
            throw std::invalid_argument("Range count must be at least 1 for signal " + config_.display_name());
        }

        const Real start = ctx_.parse(range.start);
        const Real stop = ctx_.parse(range.stop);
        points.reserve(range.count);
        points.push_back(start);
        if (range.count == 1) {
            return points;
        }

        const Real step = ctx_.divide(Real(stop - start), ctx_.from_double(static_cast<double>(range.count - 1)));
        for (size_t i = 1; i + 1 < range.count; ++i) {
            points.push_back(Real(start + step * static_cast<long>(i)));
        }
        points.push_back(stop);
        return points;
    }

    Real evaluate(const Real& t) const {
        switch (config_.type) {
            case SignalType::Square:
                return SignalFunctions::square_wave(ctx_, t, amplitude_, period_);
            case SignalType::Triangle:
                return SignalFunctions::triangle_wave(ctx_, t, amplitude_, period_);
            case SignalType::Sawtooth:
                return SignalFunctions::sawtooth_wave(ctx_, t, amplitude_, period_);
            case SignalType::UnitTriangle:
                return SignalFunctions::unit_triangle_pulse(t, amplitude_);
            case SignalType::Sigmoid:
                return SignalFunctions::sigmoid_wave(ctx_, t, amplitude_);
        }
        throw std::logic_error("Unhandled signal type");
    }

    SampleSet run() const {
        SampleSet result;
        result.signal = config_.display_name();
        result.backend = ctx_.name();
        result.dps = ctx_.digits10();

        const auto points = time_points();
        LogUtils::debug("Evaluating {} at {} point(s) with {} backend, {} digits",
                        result.signal, points.size(), result.backend, result.dps);

        result.samples.reserve(points.size());
        for (const auto& t : points) {
            result.samples.push_back(Sample{ctx_.to_string(t), ctx_.to_string(evaluate(t))});
        }
        return result;
    }

private:
    const NumericContext<Real>& ctx_;
    SignalConfig config_;
    Real amplitude_;
    Real period_;
};
