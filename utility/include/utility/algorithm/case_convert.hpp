#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to lower case by out paramter.
     *
     * @param input The string to convert.
     */
    inline void toLowerCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    }

    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result{input};
        toLowerCaseInplace(result);
        return result;
    }
}
