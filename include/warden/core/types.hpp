#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace warden {

using json = nlohmann::json;

/// How a SymlinkResolver treats a path whose final component is a symlink.
enum class SymlinkPolicy {
    Allow,    // follow; boundary checked on the final target
    Deny,     // reject any symlink
    Resolve,  // follow fully; boundary checked on the canonical target
};

NLOHMANN_JSON_SERIALIZE_ENUM(SymlinkPolicy, {
    {SymlinkPolicy::Allow, "allow"},
    {SymlinkPolicy::Deny, "deny"},
    {SymlinkPolicy::Resolve, "resolve"},
})

inline auto symlink_policy_to_string(SymlinkPolicy policy) -> std::string_view {
    switch (policy) {
        case SymlinkPolicy::Allow: return "allow";
        case SymlinkPolicy::Deny: return "deny";
        case SymlinkPolicy::Resolve: return "resolve";
    }
    return "resolve";
}

} // namespace warden
