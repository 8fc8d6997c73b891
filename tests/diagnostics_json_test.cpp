#include <cassert>
#include <iostream>
#include "backport/diagnostics_json.hpp"
#include "test_env.hpp"

using namespace backport;

void run_diagnostics_json_tests(){
    std::cout << "[core] diagnostics JSON tests...\n";
    assert(diagnostics_to_json({})=="{\"success\":true,\"errors\":[]}");

    parse_error pe("unexpected \"]\"\n", 3, 7);
    auto d = to_diagnostic(pe);
    assert(d.code=="B600" && d.line==3 && d.col==7);
    auto js = diagnostics_to_json({d});
    assert(js=="{\"success\":false,\"errors\":[{\"code\":\"B600\",\"message\":\"unexpected \\\"]\\\"\\n\",\"line\":3,\"col\":7}]}");

    assert(json_escape(std::string("a\x01" "b"))=="\"a\\u0001b\"");

    auto ov = to_diagnostic(expansion_overflow_error("too big"));
    assert(ov.code=="B300" && ov.line==-1);

    {
        scoped_env off("BACKPORT_DIAG_JSON", "");
        assert(!maybe_print_json({d}));
    }
    {
        scoped_env on("BACKPORT_DIAG_JSON", "1");
        assert(maybe_print_json({d}));
    }
}
