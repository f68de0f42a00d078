#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

// Actions and search modifiers a backend may support. Callers combine and
// test them through CapabilitySet, never through the raw bits.
enum class Capability : std::uint32_t {
    SearchRegex = 1u << 0,
    SearchEcmaRegex = 1u << 1,
    SearchDescription = 1u << 2,
    SearchName = 1u << 3,
    Query = 1u << 4,
    Remove = 1u << 5,
    Sync = 1u << 6,
    Search = 1u << 7,
    Upgrade = 1u << 8,
};

inline constexpr std::array<Capability, 5> ACTIONS = {
    Capability::Query,
    Capability::Remove,
    Capability::Sync,
    Capability::Search,
    Capability::Upgrade,
};

inline constexpr std::array<Capability, 4> SEARCH_MODIFIERS = {
    Capability::SearchRegex,
    Capability::SearchEcmaRegex,
    Capability::SearchDescription,
    Capability::SearchName,
};

class CapabilitySet {
public:
    constexpr CapabilitySet() = default;
    constexpr CapabilitySet(Capability c) : bits_(static_cast<std::uint32_t>(c)) {}

    static constexpr CapabilitySet all() {
        CapabilitySet set;
        for (Capability c : ACTIONS) set = set | c;
        for (Capability c : SEARCH_MODIFIERS) set = set | c;
        return set;
    }

    constexpr CapabilitySet operator|(CapabilitySet other) const { return from_bits(bits_ | other.bits_); }
    constexpr CapabilitySet operator&(CapabilitySet other) const { return from_bits(bits_ & other.bits_); }
    constexpr CapabilitySet operator^(CapabilitySet other) const { return from_bits(bits_ ^ other.bits_); }
    constexpr bool operator==(const CapabilitySet&) const = default;

    // True iff every capability in `required` is also in this set.
    constexpr bool test(CapabilitySet required) const {
        return (bits_ & required.bits_) == required.bits_;
    }

    constexpr bool empty() const { return bits_ == 0; }

private:
    static constexpr CapabilitySet from_bits(std::uint32_t bits) {
        CapabilitySet set;
        set.bits_ = bits;
        return set;
    }

    std::uint32_t bits_ = 0;
};

constexpr CapabilitySet operator|(Capability a, Capability b) {
    return CapabilitySet(a) | CapabilitySet(b);
}

bool capability_test(CapabilitySet mask, CapabilitySet capability);
bool is_action(Capability capability);

// Symbolic names ("QUERY", "SEARCH_NAME", ...). Unknown values or names throw
// UsageError.
const std::string& capability_name(Capability capability);
Capability capability_from_name(std::string_view name);
