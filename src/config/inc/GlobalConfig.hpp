#pragma once
#include <string>

struct GlobalConfig {
    bool verbose = false;
    std::string log_file = "log/sigwave.log";
    std::string yaml_cfg_file;
};
