// diagnostics_json.hpp - JSON serialization of backport errors
#pragma once
#include "backport/errors.hpp"
#include <string>
#include <vector>

namespace backport {

struct Diagnostic {
    std::string code;
    std::string message;
    int line = -1;
    int col = -1;
};

Diagnostic to_diagnostic(const error& e);

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const std::vector<Diagnostic>& diags);

// If BACKPORT_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
// Returns true when something was printed.
bool maybe_print_json(const std::vector<Diagnostic>& diags);

} // namespace backport
