#include "backport/registry.hpp"

#include <algorithm>

namespace backport {

namespace {

template <class Base>
std::vector<const registry_entry<Base>*> select(const Registry<Base>& registry, const std::set<std::string>& allowlist,
                                                const Version& target, const char* what){
    for(auto& name : allowlist)
        if(!registry.find(name)) throw configuration_error(std::string("unknown ") + what + " '" + name + "'");

    std::vector<const registry_entry<Base>*> out;
    for(auto& e : registry.entries()){
        if(!allowlist.empty()){
            if(!allowlist.count(e.name)) continue;
            if(!e.info.is_compatible_with(target))
                throw configuration_error(std::string(what) + " '" + e.name + "' cannot run for target " + target.to_string() + " (" + e.info.to_string() + ")");
            out.push_back(&e);
            continue;
        }
        if(!e.info.is_required_for(target)) continue;
        if(!e.info.is_compatible_with(target))
            throw incompatible_fixer_selection_error(std::string(what) + " '" + e.name + "' is required for " + target.to_string() + " but not compatible with it (" + e.info.to_string() + ")");
        out.push_back(&e);
    }
    return out;
}

} // namespace

std::vector<const FixerEntry*> resolve_fixers(const FixerRegistry& registry, const BuildConfig& config){
    return select(registry, config.fixer_allowlist, config.target_version, "fixer");
}

std::vector<const CheckerEntry*> resolve_checkers(const CheckerRegistry& registry, const BuildConfig& config,
                                                  const std::vector<const FixerEntry*>& fixers){
    auto out = select(registry, config.checker_allowlist, config.target_version, "checker");
    for(auto* c : out){
        for(auto& paired : c->pairs){
            auto it = std::find_if(fixers.begin(), fixers.end(), [&](const FixerEntry* f){ return f->name==paired; });
            if(it==fixers.end()) continue;
            if(!c->info.overlaps((*it)->info))
                throw configuration_error("checker '" + c->name + "' (" + c->info.to_string() + ") and fixer '" + paired +
                                          "' (" + (*it)->info.to_string() + ") can never apply to the same target");
        }
    }
    return out;
}

} // namespace backport
