// Build configuration: target version, cache bypass and fixer/checker allowlists.
#pragma once
#include "backport/version.hpp"
#include <set>
#include <string>
#include <string_view>

namespace backport {

struct BuildConfig {
    Version target_version = Version(std::vector<uint32_t>{2, 7});
    // Bypass any external content cache. The library has no cache of its own;
    // the flag is carried for the driver.
    bool force = true;
    // Empty means "select by version".
    std::set<std::string> fixer_allowlist;
    std::set<std::string> checker_allowlist;
};

// Splits a comma separated list, trimming blanks and dropping empty items.
std::set<std::string> parse_name_list(std::string_view text);

// Reads BACKPORT_TARGET_VERSION (default 2.7), BACKPORT_FORCE (default on),
// BACKPORT_FIXERS and BACKPORT_CHECKERS. Throws configuration_error on a
// malformed version or force value.
BuildConfig detect_build_config();

// Parses "1"/"0", "true"/"false", "yes"/"no", "on"/"off" (case insensitive).
bool parse_bool_setting(std::string_view name, std::string_view text);

} // namespace backport
