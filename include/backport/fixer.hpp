// Base classes for version-gated tree rewrites (fixers) and read-only
// validations (checkers).
#pragma once
#include "backport/ast.hpp"
#include "backport/imports.hpp"
#include "backport/transform.hpp"
#include "backport/version.hpp"
#include <string>
#include <vector>

namespace backport {

// A fixer instance serves one source unit: temporaries counters and the
// required-import list live on the instance and start empty.
class Fixer {
public:
    Fixer(std::string name, VersionInfo info) : name_(std::move(name)), info_(std::move(info)) {}
    virtual ~Fixer() = default;
    Fixer(const Fixer&) = delete;
    Fixer& operator=(const Fixer&) = delete;

    const std::string& name() const { return name_; }
    const VersionInfo& info() const { return info_; }

    // Rewrites the tree (in place where possible) and returns the new root.
    virtual node_ptr apply(const node_ptr& tree) = 0;

    // Imports the rewritten tree relies on, in first-requested order.
    const std::vector<ImportDecl>& required_imports() const { return imports_; }

protected:
    void require_import(std::string module, std::optional<std::string> member = std::nullopt){
        ImportDecl d{std::move(module), std::move(member)};
        for(auto& e : imports_) if(e==d) return;
        imports_.push_back(std::move(d));
    }

private:
    std::string name_;
    VersionInfo info_;
    std::vector<ImportDecl> imports_;
};

// Fixer driven by a Transformer whose visitors the subclass registers in its
// constructor.
class TransformerFixer : public Fixer {
public:
    using Fixer::Fixer;
    node_ptr apply(const node_ptr& tree) override { return transformer_.transform(tree); }

protected:
    Transformer transformer_;
};

class Checker {
public:
    Checker(std::string name, VersionInfo info) : name_(std::move(name)), info_(std::move(info)) {}
    virtual ~Checker() = default;

    const std::string& name() const { return name_; }
    const VersionInfo& info() const { return info_; }

    // Throws check_error at the first offending node.
    virtual void check(const node_ptr& tree) const = 0;

private:
    std::string name_;
    VersionInfo info_;
};

} // namespace backport
