#pragma once

#include <string>
#include <vector>

class TextUtils
{
public:
    /**
     * @brief Replace every invalid UTF-8 sequence with U+FFFD
     *
     * Overlong forms, surrogates and code points above U+10FFFF count as
     * invalid. Valid input is returned unchanged.
     */
    static std::string sanitizeUtf8(const std::string &input);

    // Split on "\n", "\r\n" and "\r"; a trailing terminator adds no empty line
    static std::vector<std::string> splitLines(const std::string &text);
};
