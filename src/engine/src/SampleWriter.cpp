#include "SampleWriter.hpp"
#include "LogUtils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

void SampleWriter::write_csv(std::ostream& os, const std::vector<SampleSet>& sets) {
    bool first = true;
    for (const auto& set : sets) {
        if (!first) {
            os << "\n";
        }
        first = false;

        os << "t," << set.signal << "\n";
        for (const auto& sample : set.samples) {
            os << sample.time << "," << sample.value << "\n";
        }
    }
}

void SampleWriter::write_json(std::ostream& os, const std::vector<SampleSet>& sets) {
    nlohmann::ordered_json json_array = nlohmann::ordered_json::array();

    for (const auto& set : sets) {
        nlohmann::ordered_json json_set;
        json_set["signal"] = set.signal;
        json_set["backend"] = set.backend;
        json_set["dps"] = set.dps;

        nlohmann::ordered_json samples = nlohmann::ordered_json::array();
        for (const auto& sample : set.samples) {
            nlohmann::ordered_json record;
            record["t"] = sample.time;
            record["value"] = sample.value;
            samples.push_back(std::move(record));
        }
        json_set["samples"] = std::move(samples);
        json_array.push_back(std::move(json_set));
    }

    os << json_array.dump(2) << "\n";
}

void SampleWriter::write(std::ostream& os, OutputConfig::Format format, const std::vector<SampleSet>& sets) {
    switch (format) {
        case OutputConfig::Format::Csv:
            write_csv(os, sets);
            break;
        case OutputConfig::Format::Json:
            write_json(os, sets);
            break;
    }
}

void SampleWriter::write(const OutputConfig& config, const std::vector<SampleSet>& sets) {
    if (config.file.empty()) {
        write(std::cout, config.format, sets);
        std::cout.flush();
        return;
    }

    std::ofstream file(config.file);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + config.file);
    }
    write(file, config.format, sets);
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + config.file);
    }
    LogUtils::info("Wrote {} sample set(s) to {}", sets.size(), config.file);
}
