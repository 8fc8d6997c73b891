#include "backport/pipeline.hpp"
#include "backport/features.hpp"

#include <cstdio>

namespace backport {

PipelineResult apply_pipeline(const std::vector<std::unique_ptr<Fixer>>& fixers, const node_ptr& tree){
    if(!tree) throw structural_assumption_error("cannot run fixers on an empty tree");
    const bool trace = trace_enabled();
    auto current = clone(tree);
    ImportAccumulator imports;
    for(auto& f : fixers){
        if(trace) std::fprintf(stderr, "[backport] running %s\n", f->name().c_str());
        current = f->apply(current);
        if(!current) throw structural_assumption_error("fixer '" + f->name() + "' returned an empty tree");
        imports.add_all(f->required_imports());
    }
    PipelineResult r;
    r.tree = std::move(current);
    r.imports = imports.ordered();
    if(trace) std::fprintf(stderr, "[backport] %zu fixers, %zu imports\n", fixers.size(), r.imports.size());
    return r;
}

void run_checkers(const std::vector<std::unique_ptr<Checker>>& checkers, const node_ptr& tree){
    for(auto& c : checkers){
        if(trace_enabled()) std::fprintf(stderr, "[backport] checking %s\n", c->name().c_str());
        c->check(tree);
    }
}

PipelineResult transpile_module(const BuildConfig& config, const FixerRegistry& fixers,
                                const CheckerRegistry& checkers, const node_ptr& tree){
    validate(tree);
    auto fixer_entries = resolve_fixers(fixers, config);
    auto checker_entries = resolve_checkers(checkers, config, fixer_entries);
    if(trace_enabled())
        std::fprintf(stderr, "[backport] target %s: %zu fixers, %zu checkers selected\n",
                     config.target_version.to_string().c_str(), fixer_entries.size(), checker_entries.size());
    run_checkers(instantiate(checker_entries), tree);
    auto result = apply_pipeline(instantiate(fixer_entries), tree);
    validate(result.tree);
    return result;
}

} // namespace backport
