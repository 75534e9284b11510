#include "beaconpp/TextEncoding.hpp"

#include <algorithm>
#include <iterator>

using namespace beaconpp;

namespace
{

constexpr char32_t ReplacementChar = 0xFFFD;

void appendUtf8(std::string& out, const char32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Reads one code point starting at @p pos, advancing @p pos. Malformed input yields U+FFFD.
char32_t nextUtf8(const std::span<const std::uint8_t> in, std::size_t& pos)
{
    const std::uint8_t lead = in[pos++];
    if (lead < 0x80)
        return lead;

    std::size_t extra = 0;
    char32_t cp = 0;
    char32_t minimum = 0;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        extra = 1;
        cp = lead & 0x1F;
        minimum = 0x80;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        extra = 2;
        cp = lead & 0x0F;
        minimum = 0x800;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        extra = 3;
        cp = lead & 0x07;
        minimum = 0x10000;
    }
    else
    {
        return ReplacementChar;
    }

    for (std::size_t i = 0; i < extra; ++i)
    {
        if (pos >= in.size() || (in[pos] & 0xC0) != 0x80)
            return ReplacementChar; // truncated: the offending byte starts the next sequence
        cp = (cp << 6) | (in[pos++] & 0x3F);
    }

    if (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return ReplacementChar;

    return cp;
}

char asciiLower(const char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool isAsciiSpace(const char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string_view beaconpp::encodingName(const TextEncoding encoding) noexcept
{
    switch (encoding)
    {
        case TextEncoding::Utf8:
            return "utf-8";
        case TextEncoding::Utf16LE:
            return "utf-16le";
    }
    return "unknown";
}

std::string beaconpp::decodeText(const std::span<const std::byte> bytes, const TextEncoding encoding)
{
    const std::span in(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
    std::string out;

    if (encoding == TextEncoding::Utf8)
    {
        out.reserve(in.size());
        std::size_t pos = 0;
        while (pos < in.size())
            appendUtf8(out, nextUtf8(in, pos));
        return out;
    }

    out.reserve(in.size());
    std::size_t pos = 0;
    while (pos + 1 < in.size())
    {
        const char16_t unit = static_cast<char16_t>(in[pos] | (in[pos + 1] << 8));
        pos += 2;

        if (unit >= 0xD800 && unit <= 0xDBFF)
        {
            if (pos + 1 < in.size())
            {
                const char16_t low = static_cast<char16_t>(in[pos] | (in[pos + 1] << 8));
                if (low >= 0xDC00 && low <= 0xDFFF)
                {
                    pos += 2;
                    appendUtf8(out, 0x10000 + ((static_cast<char32_t>(unit) - 0xD800) << 10) +
                                        (static_cast<char32_t>(low) - 0xDC00));
                    continue;
                }
            }
            appendUtf8(out, ReplacementChar);
        }
        else if (unit >= 0xDC00 && unit <= 0xDFFF)
        {
            appendUtf8(out, ReplacementChar);
        }
        else
        {
            appendUtf8(out, unit);
        }
    }

    if (pos < in.size())
        appendUtf8(out, ReplacementChar); // odd trailing byte

    return out;
}

std::vector<std::byte> beaconpp::encodeText(const std::string_view text, const TextEncoding encoding)
{
    const std::span in(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    std::vector<std::byte> out;

    if (encoding == TextEncoding::Utf8)
    {
        std::string normalized;
        normalized.reserve(text.size());
        std::size_t pos = 0;
        while (pos < in.size())
            appendUtf8(normalized, nextUtf8(in, pos));

        out.reserve(normalized.size());
        std::transform(normalized.begin(), normalized.end(), std::back_inserter(out),
                       [](const char c) { return static_cast<std::byte>(c); });
        return out;
    }

    out.reserve(text.size() * 2);
    auto putUnit = [&out](const char32_t unit)
    {
        out.push_back(static_cast<std::byte>(unit & 0xFF));
        out.push_back(static_cast<std::byte>((unit >> 8) & 0xFF));
    };

    std::size_t pos = 0;
    while (pos < in.size())
    {
        const char32_t cp = nextUtf8(in, pos);
        if (cp >= 0x10000)
        {
            const char32_t v = cp - 0x10000;
            putUnit(0xD800 + (v >> 10));
            putUnit(0xDC00 + (v & 0x3FF));
        }
        else
        {
            putUnit(cp);
        }
    }
    return out;
}

bool beaconpp::containsIgnoreCase(const std::string_view text, const std::string_view pattern) noexcept
{
    if (pattern.empty())
        return true;

    const auto it = std::search(text.begin(), text.end(), pattern.begin(), pattern.end(),
                                [](const char a, const char b) { return asciiLower(a) == asciiLower(b); });
    return it != text.end();
}

bool beaconpp::equalsIgnoreCase(const std::string_view lhs, const std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](const char a, const char b)
                                                  { return asciiLower(a) == asciiLower(b); });
}

std::string_view beaconpp::trimWhitespace(std::string_view text) noexcept
{
    while (!text.empty() && isAsciiSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isAsciiSpace(text.back()))
        text.remove_suffix(1);
    return text;
}
