#include "core/text_utils.hpp"

namespace
{
    const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

    bool isContinuation(unsigned char c)
    {
        return (c & 0xC0) == 0x80;
    }

    // Length of the valid sequence starting at pos, 0 when invalid. For invalid
    // input, consumed receives the number of bytes the replacement stands for.
    size_t validSequenceLength(const std::string &s, size_t pos, size_t &consumed)
    {
        const unsigned char lead = static_cast<unsigned char>(s[pos]);
        consumed = 1;
        if (lead < 0x80)
            return 1;

        size_t length;
        unsigned char lower = 0x80;
        unsigned char upper = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF)
        {
            length = 2;
        }
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            length = 3;
            if (lead == 0xE0)
                lower = 0xA0; // overlong
            else if (lead == 0xED)
                upper = 0x9F; // surrogates
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            length = 4;
            if (lead == 0xF0)
                lower = 0x90; // overlong
            else if (lead == 0xF4)
                upper = 0x8F; // above U+10FFFF
        }
        else
        {
            return 0;
        }

        for (size_t i = 1; i < length; ++i)
        {
            if (pos + i >= s.size())
                return 0;
            const unsigned char c = static_cast<unsigned char>(s[pos + i]);
            const unsigned char lo = (i == 1) ? lower : 0x80;
            const unsigned char hi = (i == 1) ? upper : 0xBF;
            if (c < lo || c > hi || !isContinuation(c))
                return 0;
            consumed = i + 1;
        }
        return length;
    }
} // namespace

std::string TextUtils::sanitizeUtf8(const std::string &input)
{
    std::string output;
    output.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size())
    {
        size_t consumed = 0;
        size_t length = validSequenceLength(input, pos, consumed);
        if (length > 0)
        {
            output.append(input, pos, length);
            pos += length;
        }
        else
        {
            output += REPLACEMENT_CHARACTER;
            pos += consumed;
        }
    }
    return output;
}

std::vector<std::string> TextUtils::splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::string current;
    bool pending = false;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\n' || c == '\r')
        {
            lines.push_back(current);
            current.clear();
            pending = false;
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        }
        else
        {
            current += c;
            pending = true;
        }
    }
    if (pending)
    {
        lines.push_back(current);
    }
    return lines;
}
