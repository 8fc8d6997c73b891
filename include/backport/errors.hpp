// Error taxonomy shared by the resolver, the fixers and the tree reader.
#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace backport {

struct node;

// Base of every error raised by the library. Each subclass carries a stable
// diagnostic code; line/col are copied from the offending node when known.
struct error : std::runtime_error
{
    error(std::string code, const std::string &message, int line = -1, int col = -1)
        : std::runtime_error(message), code_(std::move(code)), line_(line), col_(col) {}

    const std::string &code() const { return code_; }
    int line() const { return line_; }
    int col() const { return col_; }

private:
    std::string code_;
    int line_;
    int col_;
};

// Invalid or contradictory build configuration (unknown fixer, bad version, impossible window).
struct configuration_error : error
{
    explicit configuration_error(const std::string &message) : error("B100", message) {}
};

// A fixer met a tree shape it does not support.
struct structural_assumption_error : error
{
    explicit structural_assumption_error(const std::string &message, int line = -1, int col = -1)
        : error("B200", message, line, col) {}
    structural_assumption_error(const std::string &message, const node &at);
};

// The fixed-point expansion loop outgrew its bound.
struct expansion_overflow_error : error
{
    explicit expansion_overflow_error(const std::string &message) : error("B300", message) {}
};

// A fixer selected for a target lies outside its own compatibility window.
struct incompatible_fixer_selection_error : error
{
    explicit incompatible_fixer_selection_error(const std::string &message) : error("B400", message) {}
};

// A checker rejected the tree.
struct check_error : error
{
    check_error(const std::string &message, const node &at);
};

// Malformed textual tree.
struct parse_error : error
{
    explicit parse_error(const std::string &message, int line = -1, int col = -1)
        : error("B600", message, line, col) {}
};

} // namespace backport
