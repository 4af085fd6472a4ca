#pragma once

#include "ConfigData.hpp"
#include "SignalType.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            static const std::set<std::string> valid_keys = {"verbose", "log_file"};
            check_unknown_keys(node, valid_keys, "global");

            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            if (node["log_file"]) {
                rhs.log_file = node["log_file"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<NumericConfig> {
        static bool decode(const Node& node, NumericConfig& rhs) {
            static const std::set<std::string> valid_keys = {"backend", "dps"};
            check_unknown_keys(node, valid_keys, "numeric");

            if (node["backend"]) {
                rhs.backend = NumericConfig::parse_backend(node["backend"].as<std::string>());
            }
            if (node["dps"]) {
                rhs.dps = node["dps"].as<int>();
                if (rhs.dps <= 0) {
                    throw std::runtime_error("Invalid dps value in numeric: " + std::to_string(rhs.dps));
                }
            }
            return true;
        }
    };

    template<>
    struct convert<OutputConfig> {
        static bool decode(const Node& node, OutputConfig& rhs) {
            static const std::set<std::string> valid_keys = {"format", "file"};
            check_unknown_keys(node, valid_keys, "output");

            if (node["format"]) {
                rhs.format = OutputConfig::parse_format(node["format"].as<std::string>());
            }
            if (node["file"]) {
                rhs.file = node["file"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<SignalConfig::Range> {
        static bool decode(const Node& node, SignalConfig::Range& rhs) {
            static const std::set<std::string> valid_keys = {"start", "stop", "count"};
            check_unknown_keys(node, valid_keys, "signals::range");

            if (!node["start"] || !node["stop"]) {
                throw std::runtime_error("Missing required field 'start' or 'stop' in signals::range.");
            }
            rhs.start = node["start"].as<std::string>();
            rhs.stop = node["stop"].as<std::string>();

            if (node["count"]) {
                int count = node["count"].as<int>();
                if (count < 1) {
                    throw std::runtime_error("Invalid count in signals::range: " + std::to_string(count));
                }
                rhs.count = static_cast<size_t>(count);
            }
            return true;
        }
    };

    template<>
    struct convert<SignalConfig> {
        static bool decode(const Node& node, SignalConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "name", "type", "amplitude", "period", "times", "range"
            };
            check_unknown_keys(node, valid_keys, "signals");

            if (node["type"]) {
                rhs.type = SignalTypeUtils::from_string(node["type"].as<std::string>());
            } else {
                throw std::runtime_error("Missing required field 'type' in signals.");
            }

            if (node["name"]) {
                rhs.name = node["name"].as<std::string>();
            }
            if (node["amplitude"]) {
                rhs.amplitude = node["amplitude"].as<std::string>();
            }
            if (node["period"]) {
                if (!SignalTypeUtils::is_periodic(rhs.type)) {
                    throw std::runtime_error("Signal type '" + SignalTypeUtils::to_string(rhs.type) + "' does not take a period.");
                }
                rhs.period = node["period"].as<std::string>();
            }

            if (node["times"] && node["range"]) {
                throw std::runtime_error("Fields 'times' and 'range' are mutually exclusive in signals.");
            }
            if (node["times"]) {
                rhs.times = node["times"].as<std::vector<std::string>>();
                if (rhs.times.empty()) {
                    throw std::runtime_error("Field 'times' must not be empty in signals.");
                }
            } else if (node["range"]) {
                rhs.range = node["range"].as<SignalConfig::Range>();
            } else {
                throw std::runtime_error("Missing required field 'times' or 'range' in signals.");
            }
            return true;
        }
    };

}
