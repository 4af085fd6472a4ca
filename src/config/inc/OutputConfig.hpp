#pragma once
#include <string>

struct OutputConfig {
    enum class Format {
        Csv,
        Json
    } format = Format::Csv;

    std::string file;    // empty: stdout

    static Format parse_format(const std::string& name);
};
