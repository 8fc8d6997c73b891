// Named, version-windowed catalogs of fixers and checkers, and the resolver
// that picks the ones a build needs.
#pragma once
#include "backport/config.hpp"
#include "backport/errors.hpp"
#include "backport/fixer.hpp"
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace backport {

template <class Base>
struct registry_entry {
    using Factory = std::function<std::unique_ptr<Base>()>;
    std::string name;
    VersionInfo info;
    Factory factory;
    // Fixers whose output this entry depends on (checkers only): the two must
    // be able to run for the same target.
    std::vector<std::string> pairs;
};

template <class Base>
class Registry {
public:
    using Entry = registry_entry<Base>;

    // Registration order is the run order. Throws configuration_error on a
    // duplicate name.
    Registry& add(std::string name, VersionInfo info, typename Entry::Factory factory, std::vector<std::string> pairs = {}){
        if(find(name)) throw configuration_error("duplicate registration of '" + name + "'");
        entries_.push_back(Entry{std::move(name), std::move(info), std::move(factory), std::move(pairs)});
        return *this;
    }

    // Registers T under the name and window its default instance reports.
    template <class T>
    Registry& add(std::vector<std::string> pairs = {}){
        T proto;
        return add(proto.name(), proto.info(), []{ return std::unique_ptr<Base>(new T()); }, std::move(pairs));
    }

    const Entry* find(std::string_view name) const {
        for(auto& e : entries_) if(e.name==name) return &e;
        return nullptr;
    }

    // Entries live in a deque so pointers handed out stay valid while more are added.
    const std::deque<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    std::deque<Entry> entries_;
};

using FixerRegistry = Registry<Fixer>;
using CheckerRegistry = Registry<Checker>;
using FixerEntry = registry_entry<Fixer>;
using CheckerEntry = registry_entry<Checker>;

// Selection for config.target_version:
//  - an allowlist keeps exactly the named fixers (unknown name or a fixer that
//    cannot run on the target: configuration_error);
//  - an empty allowlist keeps every fixer whose apply window holds the target
//    (one that is not compatible with it: incompatible_fixer_selection_error).
// The result keeps registration order.
std::vector<const FixerEntry*> resolve_fixers(const FixerRegistry& registry, const BuildConfig& config);

// Same selection for checkers, then rejects a checker whose paired fixer is
// selected but can never be required for the same version.
std::vector<const CheckerEntry*> resolve_checkers(const CheckerRegistry& registry, const BuildConfig& config,
                                                  const std::vector<const FixerEntry*>& fixers);

// Fresh instances, one per entry, in entry order.
template <class Base>
std::vector<std::unique_ptr<Base>> instantiate(const std::vector<const registry_entry<Base>*>& entries){
    std::vector<std::unique_ptr<Base>> out;
    out.reserve(entries.size());
    for(auto* e : entries) out.push_back(e->factory());
    return out;
}

} // namespace backport
