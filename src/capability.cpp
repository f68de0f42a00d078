#include "capability.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <utility>

namespace {

const std::array<std::pair<Capability, std::string>, 9>& capability_table() {
    static const std::array<std::pair<Capability, std::string>, 9> table = {{
        {Capability::SearchRegex, "SEARCH_REGEX"},
        {Capability::SearchEcmaRegex, "SEARCH_ECMAREGEX"},
        {Capability::SearchDescription, "SEARCH_DESCRIPTION"},
        {Capability::SearchName, "SEARCH_NAME"},
        {Capability::Query, "QUERY"},
        {Capability::Remove, "REMOVE"},
        {Capability::Sync, "SYNC"},
        {Capability::Search, "SEARCH"},
        {Capability::Upgrade, "UPGRADE"},
    }};
    return table;
}

}

bool capability_test(CapabilitySet mask, CapabilitySet capability) {
    return mask.test(capability);
}

bool is_action(Capability capability) {
    return std::ranges::find(ACTIONS, capability) != ACTIONS.end();
}

const std::string& capability_name(Capability capability) {
    for (const auto& [value, name] : capability_table()) {
        if (value == capability) return name;
    }
    throw UsageError(string_format("error.unknown_capability_value", static_cast<std::uint32_t>(capability)));
}

Capability capability_from_name(std::string_view name) {
    for (const auto& [value, known] : capability_table()) {
        if (known == name) return value;
    }
    throw UsageError(string_format("error.unknown_capability", std::string(name)));
}
