// GoogleTest unit tests for probe text decoding and matching helpers
#include "beaconpp/TextEncoding.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace beaconpp;
using namespace beaconpp::test_support;

namespace
{
std::vector<std::byte> raw(std::initializer_list<unsigned char> values)
{
    std::vector<std::byte> out;
    for (const auto v : values)
        out.push_back(static_cast<std::byte>(v));
    return out;
}
} // namespace

TEST(TextEncodingTest, DecodesUtf8)
{
    EXPECT_EQ(decodeText(raw({'h', 'i'}), TextEncoding::Utf8), "hi");
    EXPECT_EQ(decodeText(raw({0xC3, 0xA9}), TextEncoding::Utf8), "\xC3\xA9");
    EXPECT_EQ(decodeText({}, TextEncoding::Utf8), "");
}

TEST(TextEncodingTest, DecodesUtf16LittleEndian)
{
    EXPECT_EQ(decodeText(raw({'h', 0, 'i', 0}), TextEncoding::Utf16LE), "hi");
    // U+1F600 as a surrogate pair
    EXPECT_EQ(decodeText(raw({0x3D, 0xD8, 0x00, 0xDE}), TextEncoding::Utf16LE), "\xF0\x9F\x98\x80");
}

TEST(TextEncodingTest, MalformedInputBecomesReplacementCharacter)
{
    const std::string replacement = "\xEF\xBF\xBD";
    EXPECT_EQ(decodeText(raw({'a', 0xFF, 'b'}), TextEncoding::Utf8), "a" + replacement + "b");
    EXPECT_EQ(decodeText(raw({0xC3}), TextEncoding::Utf8), replacement);
    EXPECT_EQ(decodeText(raw({0xC0, 0x80}), TextEncoding::Utf8), replacement + replacement);
    EXPECT_EQ(decodeText(raw({'a', 0, 'b'}), TextEncoding::Utf16LE), "a" + replacement);
    EXPECT_EQ(decodeText(raw({0x00, 0xDC, 'a', 0}), TextEncoding::Utf16LE), replacement + "a");
    EXPECT_EQ(decodeText(raw({0x3D, 0xD8, 'a', 0}), TextEncoding::Utf16LE), replacement + "a");
}

TEST(TextEncodingTest, EncodesBothEncodings)
{
    EXPECT_EQ(encodeText("hi", TextEncoding::Utf8), raw({'h', 'i'}));
    EXPECT_EQ(encodeText("hi", TextEncoding::Utf16LE), raw({'h', 0, 'i', 0}));
    EXPECT_EQ(encodeText("\xF0\x9F\x98\x80", TextEncoding::Utf16LE), raw({0x3D, 0xD8, 0x00, 0xDE}));
}

TEST(TextEncodingTest, ReplyTextSurvivesEitherEncoding)
{
    const std::string text = R"({"Address":"http://192.0.2.1:8096","Id":"x","Name":"Wohnzimmer ü"})";
    for (const auto encoding : DecodingOrder)
        EXPECT_EQ(decodeText(encodeText(text, encoding), encoding), text) << encodingName(encoding);
}

TEST(TextEncodingTest, SameBytesDecodeDifferently)
{
    const auto bytes = raw({'a', 'b'});
    EXPECT_EQ(decodeText(bytes, TextEncoding::Utf8), "ab");
    EXPECT_EQ(decodeText(bytes, TextEncoding::Utf16LE), "\xE6\x89\xA1"); // U+6261
}

TEST(TextEncodingTest, EncodingNames)
{
    EXPECT_EQ(encodingName(TextEncoding::Utf8), "utf-8");
    EXPECT_EQ(encodingName(TextEncoding::Utf16LE), "utf-16le");
}

TEST(TextMatchingTest, ContainsIgnoreCase)
{
    EXPECT_TRUE(containsIgnoreCase("hello WHO IS embyserver? there", "who is EmbyServer?"));
    EXPECT_TRUE(containsIgnoreCase("who is EmbyServer?", "who is EmbyServer?"));
    EXPECT_FALSE(containsIgnoreCase("who is Emby", "who is EmbyServer?"));
    EXPECT_FALSE(containsIgnoreCase("", "x"));
}

TEST(TextMatchingTest, EqualsIgnoreCase)
{
    EXPECT_TRUE(equalsIgnoreCase("Who Is MediaBrowserServer_V2?", "who is MediaBrowserServer_v2?"));
    EXPECT_FALSE(equalsIgnoreCase("who is MediaBrowserServer_v2? ", "who is MediaBrowserServer_v2?"));
    EXPECT_TRUE(equalsIgnoreCase("", ""));
}

TEST(TextMatchingTest, TrimWhitespace)
{
    EXPECT_EQ(trimWhitespace("  \t probe \r\n"), "probe");
    EXPECT_EQ(trimWhitespace("probe"), "probe");
    EXPECT_EQ(trimWhitespace(" \n "), "");
    EXPECT_EQ(trimWhitespace("a b"), "a b");
}
