// Read-only validations that run before the fixers and reject trees the
// selected fixers could not translate faithfully.
#pragma once
#include "backport/fixer.hpp"
#include "backport/registry.hpp"

namespace backport {

// Rebinding map/zip/filter/range would make the builtin renames wrong.
class NoOverriddenBuiltinsChecker : public Checker {
public:
    NoOverriddenBuiltinsChecker();
    void check(const node_ptr& tree) const override;
};

// `yield from` has no rewrite for targets before 3.3.
class NoYieldFromChecker : public Checker {
public:
    NoYieldFromChecker();
    void check(const node_ptr& tree) const override;
};

// The `@` operator has no rewrite for targets before 3.5.
class NoMatMultOperatorChecker : public Checker {
public:
    NoMatMultOperatorChecker();
    void check(const node_ptr& tree) const override;
};

CheckerRegistry default_checker_registry();

} // namespace backport
