// __future__ import fixers. Windows follow the Python documentation of each
// feature: mandatory from the release that introduced it up to the one that
// made it the default.
#include "backport/fixers.hpp"

namespace backport {

node_ptr FutureImportFixer::apply(const node_ptr& tree){
    require_import("__future__", feature_);
    return tree;
}

AbsoluteImportFutureFixer::AbsoluteImportFutureFixer()
    : FutureImportFixer("absolute_import_future", VersionInfo("2.5", "2.7"), "absolute_import") {}
DivisionFutureFixer::DivisionFutureFixer()
    : FutureImportFixer("division_future", VersionInfo("2.2", "2.7"), "division") {}
PrintFunctionFutureFixer::PrintFunctionFutureFixer()
    : FutureImportFixer("print_function_future", VersionInfo("2.6", "2.7"), "print_function") {}
UnicodeLiteralsFutureFixer::UnicodeLiteralsFutureFixer()
    : FutureImportFixer("unicode_literals_future", VersionInfo("2.6", "2.7"), "unicode_literals") {}
GeneratorStopFutureFixer::GeneratorStopFutureFixer()
    : FutureImportFixer("generator_stop_future", VersionInfo("3.5", "3.6"), "generator_stop") {}
WithStatementFutureFixer::WithStatementFutureFixer()
    : FutureImportFixer("with_statement_future", VersionInfo("2.5", "2.5"), "with_statement") {}
GeneratorsFutureFixer::GeneratorsFutureFixer()
    : FutureImportFixer("generators_future", VersionInfo("2.2", "2.2"), "generators") {}
NestedScopesFutureFixer::NestedScopesFutureFixer()
    : FutureImportFixer("nested_scopes_future", VersionInfo("2.1", "2.1"), "nested_scopes") {}

} // namespace backport
