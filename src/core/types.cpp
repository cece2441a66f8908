#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace promptfw {

std::optional<Action> parse_action(std::string_view name) {
    static const std::unordered_map<std::string, Action> lookup = {
        {"allow", Action::ALLOW},
        {"log",   Action::LOG},
        {"warn",  Action::WARN},
        {"block", Action::BLOCK},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(name)));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace promptfw
