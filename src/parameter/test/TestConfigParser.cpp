#include "ConfigParser.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

template <typename T>
bool rejects(const std::string& yaml, const std::string& fragment) {
    try {
        YAML::Load(yaml).as<T>();
    } catch (const std::exception& e) {
        if (std::string(e.what()).find(fragment) == std::string::npos) {
            std::cerr << "unexpected error: " << e.what() << std::endl;
            return false;
        }
        return true;
    }
    return false;
}

}

void test_GlobalConfig() {
    auto global = YAML::Load("verbose: true\nlog_file: out/run.log").as<GlobalConfig>();
    assert(global.verbose);
    assert(global.log_file == "out/run.log");

    assert(rejects<GlobalConfig>("colour: true", "Unknown configuration key in global: colour"));
    std::cout << "GlobalConfig test passed.\n";
}

void test_NumericConfig() {
    auto numeric = YAML::Load("backend: DOUBLE\ndps: 30").as<NumericConfig>();
    assert(numeric.backend == NumericConfig::Backend::Double);
    assert(numeric.dps == 30);

    auto defaults = YAML::Load("{}").as<NumericConfig>();
    assert(defaults.backend == NumericConfig::Backend::Mpfr);
    assert(defaults.dps == 15);

    assert(rejects<NumericConfig>("backend: quad", "Invalid numeric backend"));
    assert(rejects<NumericConfig>("dps: 0", "Invalid dps value"));
    std::cout << "NumericConfig test passed.\n";
}

void test_OutputConfig() {
    auto output = YAML::Load("format: json\nfile: samples.json").as<OutputConfig>();
    assert(output.format == OutputConfig::Format::Json);
    assert(output.file == "samples.json");

    assert(rejects<OutputConfig>("format: xml", "Invalid output format"));
    std::cout << "OutputConfig test passed.\n";
}

void test_SignalConfig_times() {
    auto signal = YAML::Load(R"(
name: clock
type: squarew
amplitude: "2.5"
period: 0.1
times: [0, 0.05, "0.1"]
)").as<SignalConfig>();

    assert(signal.name == "clock");
    assert(signal.type == SignalType::Square);
    assert(signal.amplitude == "2.5");
    assert(signal.period == "0.1");
    assert(signal.times.size() == 3);
    assert(signal.times[1] == "0.05");
    assert(!signal.range);
    std::cout << "SignalConfig times test passed.\n";
}

void test_SignalConfig_range() {
    auto signal = YAML::Load(R"(
type: sigmoid
range:
  start: -6
  stop: 6
  count: 13
)").as<SignalConfig>();

    assert(signal.type == SignalType::Sigmoid);
    assert(signal.display_name() == "sigmoid");
    assert(signal.amplitude == "1");
    assert(signal.range);
    assert(signal.range->start == "-6");
    assert(signal.range->stop == "6");
    assert(signal.range->count == 13);

    auto default_count = YAML::Load("type: sawtooth\nrange: {start: 0, stop: 2}").as<SignalConfig>();
    assert(default_count.range->count == 11);
    std::cout << "SignalConfig range test passed.\n";
}

void test_SignalConfig_errors() {
    assert(rejects<SignalConfig>("times: [0]", "Missing required field 'type'"));
    assert(rejects<SignalConfig>("type: sine\ntimes: [0]", "Unknown signal type"));
    assert(rejects<SignalConfig>("type: sigmoid\nperiod: 2\ntimes: [0]", "does not take a period"));
    assert(rejects<SignalConfig>("type: square", "Missing required field 'times' or 'range'"));
    assert(rejects<SignalConfig>("type: square\ntimes: []", "must not be empty"));
    assert(rejects<SignalConfig>("type: square\ntimes: [0]\nrange: {start: 0, stop: 1}", "mutually exclusive"));
    assert(rejects<SignalConfig>("type: square\nrange: {start: 0}", "Missing required field 'start' or 'stop'"));
    assert(rejects<SignalConfig>("type: square\nrange: {start: 0, stop: 1, count: 0}", "Invalid count"));
    assert(rejects<SignalConfig>("type: square\ntimes: [0]\nphase: 1", "Unknown configuration key in signals: phase"));
    std::cout << "SignalConfig errors test passed.\n";
}

int main() {
    test_GlobalConfig();
    test_NumericConfig();
    test_OutputConfig();
    test_SignalConfig_times();
    test_SignalConfig_range();
    test_SignalConfig_errors();
    std::cout << "All ConfigParser tests passed!\n";
    return 0;
}
