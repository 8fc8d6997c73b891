// Compact and pretty printers. The output is the textual tree format read back
// by backport::read_tree.
#include "backport/ast.hpp"

#include <cstdlib>
#include <functional>
#include <iomanip>
#include <sstream>

namespace backport
{

    namespace
    {
        std::string quote(const std::string &s)
        {
            std::string out = "\"";
            for (char c : s)
            {
                switch (c)
                {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                default:
                    out += c;
                }
            }
            out += '"';
            return out;
        }

        std::string format_double(double d)
        {
            // shortest form that reads back to the same value
            std::string s;
            for (int precision = 6; precision <= 17; ++precision)
            {
                std::ostringstream oss;
                oss << std::setprecision(precision) << d;
                s = oss.str();
                if (std::strtod(s.c_str(), nullptr) == d)
                    break;
            }
            // keep floats distinguishable from integers when read back
            if (s.find_first_of(".eEn") == std::string::npos)
                s += ".0";
            return s;
        }

        std::string scalar_to_string(const field_value &v)
        {
            struct V
            {
                std::string operator()(std::monostate) const { return "nil"; }
                std::string operator()(bool b) const { return b ? "true" : "false"; }
                std::string operator()(int64_t i) const { return std::to_string(i); }
                std::string operator()(double d) const { return format_double(d); }
                std::string operator()(const std::string &s) const { return quote(s); }
                std::string operator()(const string_list &l) const
                {
                    std::string out = "[";
                    bool first = true;
                    for (auto &s : l)
                    {
                        if (!first)
                            out += ' ';
                        first = false;
                        out += quote(s);
                    }
                    return out + ']';
                }
                std::string operator()(const node_ptr &) const { return std::string(); }
                std::string operator()(const node_list &) const { return std::string(); }
            };
            return std::visit(V{}, v);
        }

        bool is_scalar(const field_value &v)
        {
            if (auto *p = std::get_if<node_ptr>(&v))
                return !*p;
            if (auto *l = std::get_if<node_list>(&v))
                return l->empty();
            return true;
        }

        std::string position_suffix(const node &n)
        {
            if (n.line < 0)
                return std::string();
            return " :col_offset " + std::to_string(n.col) + " :lineno " + std::to_string(n.line);
        }
    } // namespace

    std::string to_string(const node_ptr &n)
    {
        if (!n)
            return "nil";
        std::string out = "(";
        out += kind_name(n->kind);
        for (const auto &kv : n->fields)
        {
            out += " :" + kv.first + ' ';
            if (auto *p = std::get_if<node_ptr>(&kv.second))
                out += to_string(*p);
            else if (auto *l = std::get_if<node_list>(&kv.second))
            {
                out += '[';
                bool first = true;
                for (auto &c : *l)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(c);
                }
                out += ']';
            }
            else
                out += scalar_to_string(kv.second);
        }
        out += position_suffix(*n);
        out += ')';
        return out;
    }

    std::string to_pretty_string(const node_ptr &root, int indentWidth)
    {
        auto indentStr = [](int spaces) -> std::string
        {
            if (spaces < 0)
                spaces = 0;
            return std::string(static_cast<size_t>(spaces), ' ');
        };

        const size_t MAX_INLINE_LEN = 90;

        std::function<std::string(const node_ptr &, int)> pp = [&](const node_ptr &x, int indent) -> std::string
        {
            if (!x)
                return "nil";
            bool allScalar = true;
            for (auto &kv : x->fields)
                if (!is_scalar(kv.second))
                {
                    allScalar = false;
                    break;
                }
            if (allScalar)
            {
                auto inlineForm = to_string(x);
                if (inlineForm.size() <= MAX_INLINE_LEN)
                    return inlineForm;
            }
            std::string out = "(" + std::string(kind_name(x->kind));
            for (auto &kv : x->fields)
            {
                out += '\n' + indentStr(indent + indentWidth) + ':' + kv.first + ' ';
                if (auto *p = std::get_if<node_ptr>(&kv.second))
                    out += pp(*p, indent + indentWidth);
                else if (auto *l = std::get_if<node_list>(&kv.second))
                {
                    if (l->empty())
                    {
                        out += "[]";
                        continue;
                    }
                    out += "[\n";
                    size_t i = 0;
                    for (auto &c : *l)
                    {
                        out += indentStr(indent + 2 * indentWidth) + pp(c, indent + 2 * indentWidth);
                        if (++i < l->size())
                            out += '\n';
                    }
                    out += '\n' + indentStr(indent + indentWidth) + ']';
                }
                else
                    out += scalar_to_string(kv.second);
            }
            out += position_suffix(*x);
            out += ')';
            return out;
        };
        return pp(root, 0);
    }

} // namespace backport
