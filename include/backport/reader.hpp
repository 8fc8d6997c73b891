// Textual tree format: the EDN subset printed by to_string/to_pretty_string.
//
//   (Module :body [(Expr :value (Call :func (Name :id "f" :ctx "Load")
//                                     :args [] :keywords []))])
//
// Fields left out take their schema default; `:lineno` and `:col_offset` set
// the node position; `;` starts a comment.
#pragma once
#include "backport/ast.hpp"
#include <string>
#include <string_view>

namespace backport {

// Throws parse_error on malformed text or on a form that does not describe a
// node, and structural_assumption_error when the tree breaks a schema.
node_ptr read_tree(std::string_view text, const std::string& source_name = "<string>");

} // namespace backport
