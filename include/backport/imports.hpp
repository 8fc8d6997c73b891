// Required-import bookkeeping shared by the fixers and the pipeline.
#pragma once
#include "backport/ast.hpp"
#include <optional>
#include <string>
#include <vector>

namespace backport {

// `import module` when member is empty, otherwise `from module import member`.
struct ImportDecl {
    std::string module;
    std::optional<std::string> member;

    std::string to_string() const;

    friend bool operator==(const ImportDecl& a, const ImportDecl& b){ return a.module==b.module && a.member==b.member; }
    friend bool operator!=(const ImportDecl& a, const ImportDecl& b){ return !(a==b); }
};

// Insertion-ordered set of imports. ordered() puts `__future__` imports first
// (they must lead the module), ranked by a fixed feature order, and keeps the
// rest in first-requested order.
class ImportAccumulator {
public:
    // Returns false when the import was already present.
    bool add(const ImportDecl& decl);
    void add_all(const std::vector<ImportDecl>& decls){ for(auto& d : decls) add(d); }

    bool empty() const { return imports_.empty(); }
    size_t size() const { return imports_.size(); }
    bool contains(const ImportDecl& decl) const;

    std::vector<ImportDecl> ordered() const;

private:
    std::vector<ImportDecl> imports_;
};

// Rank of a `__future__` feature in the emitted order; unknown features sort last.
int future_feature_rank(const std::string& feature);

// Inserts the statements for `imports` at the top of a Module (after a
// leading docstring), skipping any import the module already spells out.
// Returns the number of statements inserted.
size_t prepend_imports(const node_ptr& module, const std::vector<ImportDecl>& imports);

} // namespace backport
