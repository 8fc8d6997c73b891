#include "backport/fixers.hpp"

namespace backport {

FixerRegistry default_fixer_registry(){
    FixerRegistry r;
    r.add<AbsoluteImportFutureFixer>()
     .add<DivisionFutureFixer>()
     .add<PrintFunctionFutureFixer>()
     .add<UnicodeLiteralsFutureFixer>()
     .add<GeneratorStopFutureFixer>()
     .add<WithStatementFutureFixer>()
     .add<GeneratorsFutureFixer>()
     .add<NestedScopesFutureFixer>();
    // annotations go before the signature rewrite so kw-only args lose theirs first
    r.add<RemoveAnnAssignFixer>()
     .add<RemoveFunctionDefAnnotationsFixer>()
     .add<ShortToLongFormSuperFixer>()
     .add<InlineKwOnlyArgsFixer>()
     .add<FStringToStrFormatFixer>()
     .add<NewStyleClassesFixer>();
    // itertools_builtins must see the map/zip/filter names before any later
    // rewrite introduces calls of its own
    r.add<ItertoolsBuiltinsFixer>()
     .add<RangeToXrangeFixer>()
     .add<UnpackingGeneralizationsFixer>();
    return r;
}

} // namespace backport
