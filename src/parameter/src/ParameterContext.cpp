#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--signal", 's', "Signal type: square, triangle, sawtooth, unit_triangle, sigmoid", true},
    {"--amplitude", 'a', "Signal amplitude (default 1)", true},
    {"--period", 'p', "Signal period for periodic signals (default 1)", true},
    {"--times", 't', "Comma separated time values to sample", true},
    {"--backend", 'b', "Numeric backend: double or mpfr (default mpfr)", true},
    {"--dps", 'd', "Working precision in decimal digits (default 15)", true},
    {"--format", 'f', "Output format: csv or json (default csv)", true},
    {"--output", 'o', "Write samples to file instead of stdout", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: sigwave [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  sigwave --config-file=signals.yaml\n"
              << "  sigwave -s square -p 2 -t 0,0.5,1,1.5\n"
              << "  sigwave -s sigmoid -d 25 -t -1,0,1 -f json\n\n";
}

void ParameterContext::show_version() {
    std::cout << "sigwave version: " << SIGWAVE_VERSION << std::endl;
    std::cout << "build: " << SIGWAVE_BUILD_TARGET << std::endl;
}

void ParameterContext::parse_global(const YAML::Node& global_yaml) {
    config_data.global = global_yaml.as<GlobalConfig>();
}

void ParameterContext::parse_signals(const YAML::Node& signals_yaml) {
    if (!signals_yaml.IsSequence()) {
        throw std::runtime_error("Configuration key 'signals' must be a list.");
    }

    config_data.signals.clear();
    for (const auto& signal_node : signals_yaml) {
        config_data.signals.push_back(signal_node.as<SignalConfig>());
    }
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    // Detect unknown configuration keys
    static const std::set<std::string> valid_keys = {
        "global", "numeric", "output", "signals"
    };
    YAML::check_unknown_keys(config, valid_keys, "root");

    if (config["global"]) {
        parse_global(config["global"]);
    }

    if (config["numeric"]) {
        config_data.numeric = config["numeric"].as<NumericConfig>();
    }

    if (config["output"]) {
        config_data.output = config["output"].as<OutputConfig>();
    }

    if (config["signals"]) {
        parse_signals(config["signals"]);
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        config_data.global.yaml_cfg_file = file_path;
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                // Take value from next argv
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg.size() >= 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--backend")) {
        config_data.numeric.backend = NumericConfig::parse_backend(cli_params["--backend"]);
    }

    if (cli_params.count("--dps")) {
        try {
            config_data.numeric.dps = std::stoi(cli_params["--dps"]);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid dps value: " + cli_params["--dps"]);
        }
    }

    if (cli_params.count("--format")) {
        config_data.output.format = OutputConfig::parse_format(cli_params["--format"]);
    }

    if (cli_params.count("--output")) {
        config_data.output.file = cli_params["--output"];
    }

    if (cli_params.count("--verbose")) {
        config_data.global.verbose = true;
    }

    if (cli_params.count("--signal")) {
        // A signal on the command line replaces the configured list
        config_data.signals.clear();
        config_data.signals.push_back(signal_from_commandline());
    } else if (cli_params.count("--amplitude") || cli_params.count("--period") || cli_params.count("--times")) {
        throw std::runtime_error("Options --amplitude, --period and --times require --signal");
    }
}

SignalConfig ParameterContext::signal_from_commandline() const {
    SignalConfig signal;
    signal.type = SignalTypeUtils::from_string(cli_params.at("--signal"));

    if (cli_params.count("--amplitude")) {
        signal.amplitude = cli_params.at("--amplitude");
    }

    if (cli_params.count("--period")) {
        if (!SignalTypeUtils::is_periodic(signal.type)) {
            throw std::runtime_error("Signal type '" + SignalTypeUtils::to_string(signal.type) + "' does not take a period.");
        }
        signal.period = cli_params.at("--period");
    }

    if (!cli_params.count("--times")) {
        throw std::runtime_error("Option --signal requires --times");
    }

    signal.times = StringUtils::split(cli_params.at("--times"), ',');
    if (signal.times.empty()) {
        throw std::runtime_error("Option --times must list at least one value");
    }
    return signal;
}

void ParameterContext::merge_environment_vars() {
    // Define environment variables to read
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"SIGWAVE_BACKEND", "backend"},
        {"SIGWAVE_DPS", "dps"},
        {"SIGWAVE_FORMAT", "format"}
    };

    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (!env_value) continue;

        if (key == "backend") {
            config_data.numeric.backend = NumericConfig::parse_backend(env_value);
        } else if (key == "dps") {
            try {
                config_data.numeric.dps = std::stoi(env_value);
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid " + env_var + " value: " + env_value);
            }
        } else if (key == "format") {
            config_data.output.format = OutputConfig::parse_format(env_value);
        }
    }
}

void ParameterContext::validate() const {
    if (config_data.signals.empty()) {
        throw std::runtime_error("No signal configured; use --signal or a config file with 'signals'");
    }

    if (config_data.numeric.dps <= 0) {
        throw std::runtime_error("Invalid dps value: " + std::to_string(config_data.numeric.dps));
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
    merge_environment_vars();
    merge_commandline();
    validate();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const NumericConfig& ParameterContext::get_numeric_config() const {
    return config_data.numeric;
}

const OutputConfig& ParameterContext::get_output_config() const {
    return config_data.output;
}

const std::vector<SignalConfig>& ParameterContext::get_signals() const {
    return config_data.signals;
}
