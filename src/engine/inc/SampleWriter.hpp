#pragma once
#include "OutputConfig.hpp"
#include "Sample.hpp"
#include <ostream>
#include <string>
#include <vector>

class SampleWriter {
public:
    // One "t,<signal>" block per set, blocks separated by an empty line
    static void write_csv(std::ostream& os, const std::vector<SampleSet>& sets);

    // Array of {"signal","backend","dps","samples":[{"t","value"}]}; numbers kept as strings
    static void write_json(std::ostream& os, const std::vector<SampleSet>& sets);

    static void write(std::ostream& os, OutputConfig::Format format, const std::vector<SampleSet>& sets);

    // Writes to config.file, or stdout when no file is configured
    static void write(const OutputConfig& config, const std::vector<SampleSet>& sets);
};
