/**
 * @file ResponderRegistry.hpp
 * @brief Ordered pattern-to-handler table used to route probes.
 */

#pragma once

#include "TextEncoding.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beaconpp
{

/**
 * @brief Phrase a current client includes in its probe. Matched as a substring.
 * @ingroup discovery
 */
inline constexpr std::string_view DiscoveryPhrase = "who is EmbyServer?";

/**
 * @brief Phrase sent by older clients. Must be the whole (trimmed) probe.
 * @ingroup discovery
 */
inline constexpr std::string_view LegacyDiscoveryPhrase = "who is MediaBrowserServer_v2?";

/**
 * @brief How a responder pattern is compared with probe text. Both kinds ignore ASCII case.
 * @ingroup discovery
 */
enum class MatchKind : std::uint8_t
{
    Substring = 0, ///< Pattern occurs anywhere in the text.
    Exact = 1      ///< Pattern equals the text with surrounding whitespace removed.
};

/**
 * @brief Callback run for a matched probe.
 * @ingroup discovery
 *
 * Arguments: the full decoded probe text, the sender as endpoint text, and the encoding the
 * probe matched under (the reply must use it too). May throw; the Dispatcher logs the error.
 */
using ResponderHandler =
    std::function<void(const std::string& matchedText, const std::string& remoteEndpoint, TextEncoding encoding)>;

/**
 * @struct ResponderEntry
 * @ingroup discovery
 * @brief One registered responder.
 */
struct ResponderEntry
{
    std::string pattern;
    MatchKind kind = MatchKind::Substring;
    ResponderHandler handler;

    /**
     * @brief Whether this entry's pattern matches @p text under its match kind.
     */
    [[nodiscard]] bool matches(std::string_view text) const noexcept;
};

/**
 * @struct ResponderMatch
 * @ingroup discovery
 * @brief Result of a successful lookup.
 *
 * `entry` points into the registry that produced it and stays valid as long as that registry.
 */
struct ResponderMatch
{
    std::string matchedText;
    const ResponderEntry* entry = nullptr;
};

/**
 * @class ResponderRegistry
 * @ingroup discovery
 * @brief Ordered list of responders; the first matching entry wins.
 *
 * Filled once while the owning server is constructed, then shared as
 * `std::shared_ptr<const ResponderRegistry>`. Concurrent lookup() calls need no locking because
 * nothing mutates the registry after that point.
 */
class ResponderRegistry
{
  public:
    /**
     * @brief Appends a responder. No de-duplication; earlier entries take priority.
     *
     * @throws std::invalid_argument if @p pattern is empty or @p handler is empty.
     */
    void add(std::string pattern, MatchKind kind, ResponderHandler handler);

    /**
     * @brief Finds the first entry, in registration order, whose pattern matches @p text.
     *
     * @return The decoded text together with the entry, or `std::nullopt`.
     */
    [[nodiscard]] std::optional<ResponderMatch> lookup(std::string_view text) const;

    [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }
    [[nodiscard]] const std::vector<ResponderEntry>& entries() const noexcept { return _entries; }

  private:
    std::vector<ResponderEntry> _entries;
};

} // namespace beaconpp
