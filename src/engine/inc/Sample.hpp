#pragma once
#include <string>
#include <vector>

// One evaluated point, rendered by the numeric context
struct Sample {
    std::string time;
    std::string value;
};

struct SampleSet {
    std::string signal;
    std::string backend;
    int dps = 0;
    std::vector<Sample> samples;
};
