/**
 * @file TextEncoding.hpp
 * @brief Decoding and encoding of probe and reply text.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beaconpp
{

/**
 * @brief Text encodings a probe may arrive in, listed in the order they are tried.
 * @ingroup discovery
 *
 * The reply to a probe is encoded with the same encoding the probe matched under.
 */
enum class TextEncoding : std::uint8_t
{
    Utf8 = 0,   ///< 8-bit variable width; tried first.
    Utf16LE = 1 ///< 16-bit little-endian code units; tried when UTF-8 text matches no responder.
};

/**
 * @brief Decoding attempt order used by the Dispatcher.
 * @ingroup discovery
 */
inline constexpr std::array<TextEncoding, 2> DecodingOrder{TextEncoding::Utf8, TextEncoding::Utf16LE};

/**
 * @brief Short display name of an encoding ("utf-8", "utf-16le").
 * @ingroup discovery
 */
[[nodiscard]] std::string_view encodingName(TextEncoding encoding) noexcept;

/**
 * @brief Decodes raw bytes into UTF-8 text.
 * @ingroup discovery
 *
 * Decoding never fails. Malformed input (invalid or overlong UTF-8, unpaired UTF-16 surrogates,
 * an odd trailing byte in UTF-16) decodes to U+FFFD REPLACEMENT CHARACTER, one per maximal
 * invalid subsequence.
 *
 * @param bytes    Raw datagram payload.
 * @param encoding Encoding to interpret @p bytes under.
 * @return The text as UTF-8.
 */
[[nodiscard]] std::string decodeText(std::span<const std::byte> bytes, TextEncoding encoding);

/**
 * @brief Encodes UTF-8 text into bytes of the given encoding.
 * @ingroup discovery
 *
 * Invalid UTF-8 in @p text is replaced by U+FFFD. No byte order mark is written.
 */
[[nodiscard]] std::vector<std::byte> encodeText(std::string_view text, TextEncoding encoding);

/**
 * @brief Case-insensitive substring test (ASCII case folding).
 * @ingroup discovery
 */
[[nodiscard]] bool containsIgnoreCase(std::string_view text, std::string_view pattern) noexcept;

/**
 * @brief Case-insensitive equality (ASCII case folding).
 * @ingroup discovery
 */
[[nodiscard]] bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

/**
 * @brief @p text without leading and trailing whitespace.
 * @ingroup discovery
 */
[[nodiscard]] std::string_view trimWhitespace(std::string_view text) noexcept;

} // namespace beaconpp
