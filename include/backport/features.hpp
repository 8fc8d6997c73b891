#pragma once
#include <cstdlib>

namespace backport {
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
// BACKPORT_TRACE=1 prints "[backport] ..." progress lines to stderr.
inline bool trace_enabled(){ return flag_enabled("BACKPORT_TRACE"); }
// BACKPORT_DIAG_JSON=1 makes the driver report errors as JSON.
inline bool diag_json_enabled(){ return flag_enabled("BACKPORT_DIAG_JSON"); }
}
