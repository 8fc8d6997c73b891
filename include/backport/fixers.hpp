// Fixer catalog. Every fixer is default constructible and reports its own
// name and version window; default_fixer_registry() lists them in run order.
#pragma once
#include "backport/fixer.hpp"
#include "backport/registry.hpp"
#include <string>

namespace backport {

// ---- __future__ imports ----

// Requires `from __future__ import <feature>` and leaves the tree alone.
class FutureImportFixer : public Fixer {
public:
    FutureImportFixer(std::string name, VersionInfo info, std::string feature)
        : Fixer(std::move(name), std::move(info)), feature_(std::move(feature)) {}
    node_ptr apply(const node_ptr& tree) override;
    const std::string& feature() const { return feature_; }
private:
    std::string feature_;
};

struct AbsoluteImportFutureFixer : FutureImportFixer { AbsoluteImportFutureFixer(); };
struct DivisionFutureFixer : FutureImportFixer { DivisionFutureFixer(); };
struct PrintFunctionFutureFixer : FutureImportFixer { PrintFunctionFutureFixer(); };
struct UnicodeLiteralsFutureFixer : FutureImportFixer { UnicodeLiteralsFutureFixer(); };
struct GeneratorStopFutureFixer : FutureImportFixer { GeneratorStopFutureFixer(); };
struct WithStatementFutureFixer : FutureImportFixer { WithStatementFutureFixer(); };
struct GeneratorsFutureFixer : FutureImportFixer { GeneratorsFutureFixer(); };
struct NestedScopesFutureFixer : FutureImportFixer { NestedScopesFutureFixer(); };

// ---- annotations ----

// `x: T = v` -> `x = v`, `x: T` -> `x = None`. Only plain names are accepted
// as targets.
class RemoveAnnAssignFixer : public TransformerFixer {
public:
    RemoveAnnAssignFixer();
};

// Drops return and parameter annotations from every def.
class RemoveFunctionDefAnnotationsFixer : public Fixer {
public:
    RemoveFunctionDefAnnotationsFixer();
    node_ptr apply(const node_ptr& tree) override;
};

// ---- classes ----

// `super()` inside a method -> `super(Class, self)`, where self is the
// method's first parameter.
class ShortToLongFormSuperFixer : public TransformerFixer {
public:
    ShortToLongFormSuperFixer();
};

// `class A:` -> `class A(object):`
class NewStyleClassesFixer : public TransformerFixer {
public:
    NewStyleClassesFixer();
};

// ---- functions ----

// Keyword-only parameters become lookups in the `**kwargs` mapping at the top
// of the body. Defaults must be literals.
class InlineKwOnlyArgsFixer : public TransformerFixer {
public:
    InlineKwOnlyArgsFixer();
};

// f"a{b!r:>{w}}" -> "a{0!r:>{1}}".format(b, w)
class FStringToStrFormatFixer : public TransformerFixer {
public:
    FStringToStrFormatFixer();
};

// ---- builtins ----

// map/zip/filter -> itertools.imap/izip/ifilter. Requires `import itertools`
// only when a rewrite happened.
class ItertoolsBuiltinsFixer : public TransformerFixer {
public:
    ItertoolsBuiltinsFixer();
};

// range -> xrange
class RangeToXrangeFixer : public Fixer {
public:
    RangeToXrangeFixer();
    node_ptr apply(const node_ptr& tree) override;
};

// ---- unpacking generalizations ----

// Rewrites calls and literals that carry anything after a `*x` (or after a
// `**m`) into statements that build the arguments in a temporary first:
//
//     f(*a, 1, *b)        upg_args_0 = []
//                         upg_args_0.extend(a)
//                         upg_args_0.append(1)
//                         upg_args_0.extend(b)
//                         f(*upg_args_0)
//                         del upg_args_0
//
// Each statement block is rewritten until it stops growing; growth past 100
// times the original length raises expansion_overflow_error.
class UnpackingGeneralizationsFixer : public Fixer {
public:
    UnpackingGeneralizationsFixer();
    node_ptr apply(const node_ptr& tree) override;

    // Rewrites one statement block in place.
    void apply_body_updates(node_list& body);

    static constexpr size_t kMaxGrowthFactor = 100;

private:
    struct val_update {
        node_list prefix;
        node_ptr value;
        node_list cleanup;
    };
    struct hoist {
        node_list prefix;
        node_list cleanup;
        bool empty() const { return prefix.empty(); }
    };

    std::string temp_name(const char* base);
    node_ptr hoist_callee(const node_ptr& call, val_update& u);
    val_update expand_args(const node_ptr& n);
    val_update expand_kwargs(const node_ptr& n);
    std::optional<val_update> make_val_update(const node_ptr& n);
    std::optional<val_update> single_update(const node_ptr& n);
    void hoist_field(const node_ptr& owner, const std::string& name, hoist& acc);
    void descend(const node_ptr& n, hoist& acc);
    hoist process_statement(const node_ptr& stmt);

    int next_index_ = 0;
};

// Every fixer in run order: __future__ imports, annotation and signature
// rewrites, then the expression rewrites, with unpacking last.
FixerRegistry default_fixer_registry();

} // namespace backport
