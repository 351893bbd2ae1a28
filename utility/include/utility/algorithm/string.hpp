#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string const& input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    inline bool isSpace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline std::string_view trimLeft(std::string_view input)
    {
        while (!input.empty() && isSpace(input.front()))
            input.remove_prefix(1);
        return input;
    }

    inline std::string_view trimRight(std::string_view input)
    {
        while (!input.empty() && isSpace(input.back()))
            input.remove_suffix(1);
        return input;
    }

    /**
     * @brief Removes leading and trailing whitespace, including line terminators.
     */
    inline std::string_view trim(std::string_view input)
    {
        return trimRight(trimLeft(input));
    }

    /**
     * @brief Number of code points in UTF-8 encoded input. Continuation bytes are not counted.
     */
    inline std::size_t codePointCount(std::string_view input)
    {
        return static_cast<std::size_t>(std::count_if(input.begin(), input.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }

    /**
     * @brief Returns everything after the last '/' or the whole input if there is none.
     */
    inline std::string_view lastSegment(std::string_view input)
    {
        const auto pos = input.find_last_of('/');
        if (pos == std::string_view::npos)
            return input;
        return input.substr(pos + 1);
    }
}
