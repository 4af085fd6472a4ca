#include "SignalRunner.hpp"
#include "SignalEngine.hpp"
#include "DoubleContext.hpp"
#include "MpfrContext.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

SignalConfig make_signal(SignalType type, std::vector<std::string> times) {
    SignalConfig signal;
    signal.type = type;
    signal.times = std::move(times);
    return signal;
}

std::vector<std::string> values_of(const SampleSet& set) {
    std::vector<std::string> values;
    for (const auto& sample : set.samples) {
        values.push_back(sample.value);
    }
    return values;
}

}

void test_explicit_times() {
    SignalConfig signal = make_signal(SignalType::Square, {"0", "0.5", "1", "1.5"});
    signal.period = "2";

    SampleSet set = SignalRunner<double>(DoubleContext::instance(), signal).run();
    assert(set.signal == "square");
    assert(set.backend == "double");
    assert(set.samples.size() == 4);
    assert(set.samples[1].time == "0.5");
    assert((values_of(set) == std::vector<std::string>{"1", "1", "-1", "-1"}));
    std::cout << "test_explicit_times passed." << std::endl;
}

void test_range_points() {
    SignalConfig signal;
    signal.type = SignalType::Sawtooth;
    signal.range = SignalConfig::Range{"0", "1", 5};

    SignalRunner<double> runner(DoubleContext::instance(), signal);
    std::vector<double> points = runner.time_points();
    assert((points == std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}));

    signal.range = SignalConfig::Range{"-2", "3", 1};
    assert((SignalRunner<double>(DoubleContext::instance(), signal).time_points() == std::vector<double>{-2.0}));
    std::cout << "test_range_points passed." << std::endl;
}

void test_range_endpoints_exact() {
    MpfrContext ctx(30);
    SignalConfig signal;
    signal.type = SignalType::Sigmoid;
    signal.range = SignalConfig::Range{"0", "0.3", 4};

    auto points = SignalRunner<MpfrReal>(ctx, signal).time_points();
    assert(points.size() == 4);
    assert(points.front() == 0);
    assert(points.back() == ctx.parse("0.3"));
    std::cout << "test_range_endpoints_exact passed." << std::endl;
}

void test_mpfr_run() {
    MpfrContext ctx(25);
    SignalConfig signal = make_signal(SignalType::Sigmoid, {"0", "1"});
    signal.name = "s1";

    SampleSet set = SignalRunner<MpfrReal>(ctx, signal).run();
    assert(set.signal == "s1");
    assert(set.backend == "mpfr");
    assert(set.dps == 25);
    assert(set.samples[0].value == "0.5");
    assert(set.samples[1].value.rfind("0.73105857863000487925115", 0) == 0);
    std::cout << "test_mpfr_run passed." << std::endl;
}

void test_unit_triangle_and_amplitude() {
    SignalConfig signal = make_signal(SignalType::UnitTriangle, {"-1", "-0.5", "0", "2"});
    signal.amplitude = "4";

    SampleSet set = SignalRunner<double>(DoubleContext::instance(), signal).run();
    assert((values_of(set) == std::vector<std::string>{"0", "2", "4", "0"}));
    std::cout << "test_unit_triangle_and_amplitude passed." << std::endl;
}

void test_invalid_inputs() {
    SignalConfig bad_amplitude = make_signal(SignalType::Square, {"0"});
    bad_amplitude.amplitude = "loud";
    try {
        SignalRunner<double> runner(DoubleContext::instance(), bad_amplitude);
        assert(false);
    } catch (const std::invalid_argument& e) {
        assert(std::string(e.what()).find("loud") != std::string::npos);
    }

    SignalConfig bad_time = make_signal(SignalType::Square, {"0", "soon"});
    MpfrContext ctx(20);
    try {
        SignalRunner<MpfrReal>(ctx, bad_time).run();
        assert(false);
    } catch (const std::invalid_argument&) {
    }

    SignalConfig zero_period = make_signal(SignalType::Triangle, {"0.5"});
    zero_period.period = "0";
    try {
        SignalRunner<MpfrReal>(ctx, zero_period).run();
        assert(false);
    } catch (const DivisionByZeroError&) {
    }
    std::cout << "test_invalid_inputs passed." << std::endl;
}

void test_engine_backends() {
    SignalConfig signal = make_signal(SignalType::Triangle, {"0.25"});
    signal.period = "2";

    NumericConfig numeric;
    numeric.backend = NumericConfig::Backend::Double;
    SampleSet host = SignalEngine(numeric).run(signal);
    assert(host.backend == "double");
    assert(host.samples[0].value == "0.5");

    numeric.backend = NumericConfig::Backend::Mpfr;
    numeric.dps = 40;
    auto sets = SignalEngine(numeric).run_all({signal, make_signal(SignalType::Sigmoid, {"0"})});
    assert(sets.size() == 2);
    assert(sets[0].backend == "mpfr");
    assert(sets[0].dps == 40);
    assert(sets[0].samples[0].value == "0.5");
    assert(sets[1].signal == "sigmoid");

    numeric.dps = 0;
    try {
        SignalEngine(numeric).run(signal);
        assert(false);
    } catch (const std::invalid_argument&) {
    }
    std::cout << "test_engine_backends passed." << std::endl;
}

int main() {
    test_explicit_times();
    test_range_points();
    test_range_endpoints_exact();
    test_mpfr_run();
    test_unit_triangle_and_amplitude();
    test_invalid_inputs();
    test_engine_backends();
    std::cout << "All SignalRunner tests passed!" << std::endl;
    return 0;
}
