// Running a resolved build over one source unit.
#pragma once
#include "backport/checkers.hpp"
#include "backport/config.hpp"
#include "backport/fixers.hpp"
#include <memory>
#include <vector>

namespace backport {

struct PipelineResult {
    node_ptr tree;
    // De-duplicated union of every fixer's imports, __future__ first.
    std::vector<ImportDecl> imports;
};

// Runs the fixers in order on a deep copy of `tree`; the caller's tree is
// never modified. The first fixer error propagates unchanged.
PipelineResult apply_pipeline(const std::vector<std::unique_ptr<Fixer>>& fixers, const node_ptr& tree);

// Throws check_error from the first checker that rejects the tree.
void run_checkers(const std::vector<std::unique_ptr<Checker>>& checkers, const node_ptr& tree);

// validate -> resolve -> check -> fix -> validate, with fresh fixer instances.
PipelineResult transpile_module(const BuildConfig& config, const FixerRegistry& fixers,
                                const CheckerRegistry& checkers, const node_ptr& tree);

} // namespace backport
