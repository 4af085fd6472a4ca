#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);

    // Splits on delimiter, trims each piece and drops empty ones
    static std::vector<std::string> split(const std::string& str, char delimiter);
};
