#include "OutputConfig.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

OutputConfig::Format OutputConfig::parse_format(const std::string& name) {
    const std::string key = StringUtils::to_lower(name);
    if (key == "csv") {
        return Format::Csv;
    } else if (key == "json") {
        return Format::Json;
    }
    throw std::runtime_error("Invalid output format: " + name + " (expected csv or json)");
}
