#include "beaconpp/ResponderRegistry.hpp"

#include <stdexcept>
#include <utility>

using namespace beaconpp;

bool ResponderEntry::matches(const std::string_view text) const noexcept
{
    switch (kind)
    {
        case MatchKind::Substring:
            return containsIgnoreCase(text, pattern);
        case MatchKind::Exact:
            return equalsIgnoreCase(trimWhitespace(text), pattern);
    }
    return false;
}

void ResponderRegistry::add(std::string pattern, const MatchKind kind, ResponderHandler handler)
{
    if (pattern.empty())
        throw std::invalid_argument("ResponderRegistry::add(): pattern must not be empty");
    if (!handler)
        throw std::invalid_argument("ResponderRegistry::add(): handler must not be empty");

    _entries.push_back(ResponderEntry{std::move(pattern), kind, std::move(handler)});
}

std::optional<ResponderMatch> ResponderRegistry::lookup(const std::string_view text) const
{
    for (const auto& entry : _entries)
    {
        if (entry.matches(text))
            return ResponderMatch{std::string(text), &entry};
    }
    return std::nullopt;
}
