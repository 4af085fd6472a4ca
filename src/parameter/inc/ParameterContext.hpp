#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const NumericConfig& get_numeric_config() const;
    const OutputConfig& get_output_config() const;
    const std::vector<SignalConfig>& get_signals() const;

private:
    ConfigData config_data;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

    void parse_global(const YAML::Node& global_node);
    void parse_signals(const YAML::Node& signals_node);
    SignalConfig signal_from_commandline() const;
    void validate() const;

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--dps")
        char short_opt;          // Short option (e.g. 'd')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
