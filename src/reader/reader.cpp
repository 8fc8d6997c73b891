#include "backport/reader.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

#include <limits>

namespace backport {

namespace reader::actions {

std::string unescape(const std::string& quoted){
    std::string out;
    out.reserve(quoted.size());
    // drop the surrounding quotes
    for(size_t i=1; i+1<quoted.size(); ++i){
        char c = quoted[i];
        if(c!='\\'){ out += c; continue; }
        char e = quoted[++i];
        switch(e){
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '0': out += '\0'; break;
            default: out += e; break;
        }
    }
    return out;
}

} // namespace reader::actions

namespace {

using reader::form;
using reader::form_ptr;

[[noreturn]] void fail(const std::string& message, const form& at){
    throw parse_error(message, at.line, at.col);
}

const char* type_name(form::type t){
    switch(t){
        case form::type::nil: return "nil";
        case form::type::boolean: return "boolean";
        case form::type::integer: return "integer";
        case form::type::floating: return "float";
        case form::type::string: return "string";
        case form::type::keyword: return "keyword";
        case form::type::symbol: return "symbol";
        case form::type::list: return "list";
        case form::type::vector: return "vector";
    }
    return "?";
}

node_ptr to_node(const form& f);

node_ptr to_child(const form& f, bool allow_nil, const std::string& where){
    if(f.t==form::type::nil){
        if(!allow_nil) fail("field " + where + " requires a node, got nil", f);
        return nullptr;
    }
    if(f.t!=form::type::list) fail("field " + where + " expects a node form, got " + type_name(f.t), f);
    return to_node(f);
}

node_list to_children(const form& f, bool allow_nil, const std::string& where){
    if(f.t!=form::type::vector) fail("field " + where + " expects a vector, got " + type_name(f.t), f);
    node_list out;
    out.reserve(f.items.size());
    for(auto& item : f.items) out.push_back(to_child(*item, allow_nil, where));
    return out;
}

field_value to_field(const field_spec& fs, const form& f, const std::string& where){
    switch(fs.cls){
        case field_class::node: return to_child(f, false, where);
        case field_class::optional_node: return to_child(f, true, where);
        case field_class::node_list:
        case field_class::stmt_list: return to_children(f, false, where);
        case field_class::optional_node_list: return to_children(f, true, where);
        case field_class::string:
            if(f.t!=form::type::string) fail("field " + where + " expects a string, got " + type_name(f.t), f);
            return f.s;
        case field_class::optional_string:
            if(f.t==form::type::nil) return std::monostate{};
            if(f.t!=form::type::string) fail("field " + where + " expects a string or nil, got " + type_name(f.t), f);
            return f.s;
        case field_class::constant:
            switch(f.t){
                case form::type::nil: return std::monostate{};
                case form::type::boolean: return f.b;
                case form::type::integer: return f.i;
                case form::type::floating: return f.d;
                default: fail("field " + where + " expects nil, a boolean or a number, got " + type_name(f.t), f);
            }
        case field_class::string_list: {
            if(f.t!=form::type::vector) fail("field " + where + " expects a vector of strings, got " + type_name(f.t), f);
            string_list out;
            for(auto& item : f.items){
                if(item->t!=form::type::string) fail("field " + where + " expects strings, got " + type_name(item->t), *item);
                out.push_back(item->s);
            }
            return out;
        }
        case field_class::integer:
            if(f.t!=form::type::integer) fail("field " + where + " expects an integer, got " + type_name(f.t), f);
            return f.i;
    }
    fail("unsupported field " + where, f);
}

int to_position(const form& f, const char* name){
    if(f.t!=form::type::integer) fail(std::string(":") + name + " expects an integer", f);
    if(f.i<-1 || f.i>std::numeric_limits<int>::max())
        fail(std::string(":") + name + " " + std::to_string(f.i) + " is out of range", f);
    return static_cast<int>(f.i);
}

node_ptr to_node(const form& f){
    if(f.t!=form::type::list) fail(std::string("expected a node form, got ") + type_name(f.t), f);
    if(f.items.empty() || f.items[0]->t!=form::type::symbol) fail("node form must start with a kind name", f);
    const auto& kind_text = f.items[0]->s;
    auto kind = kind_from_name(kind_text);
    if(!kind) fail("unknown node kind '" + kind_text + "'", *f.items[0]);

    auto n = make_node(*kind);
    if((f.items.size() - 1) % 2 != 0) fail("node form '" + kind_text + "' has a field without a value", f);
    for(size_t i=1; i<f.items.size(); i+=2){
        const auto& key = *f.items[i];
        const auto& val = *f.items[i+1];
        if(key.t!=form::type::keyword) fail("expected a field keyword in '" + kind_text + "', got " + type_name(key.t), key);
        if(key.s=="lineno"){ n->line = to_position(val, "lineno"); continue; }
        if(key.s=="col_offset"){ n->col = to_position(val, "col_offset"); continue; }
        const auto* fs = find_field(*kind, key.s);
        if(!fs) fail("unknown field " + kind_text + "." + key.s, key);
        n->fields[key.s] = to_field(*fs, val, kind_text + "." + key.s);
    }
    return n;
}

} // namespace

node_ptr read_tree(std::string_view text, const std::string& source_name){
    using namespace reader;
    tao::pegtl::memory_input in(text.data(), text.size(), source_name);
    read_state st;
    try {
        tao::pegtl::parse< grammar::document, actions::action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw parse_error(source_name + ": " + std::string(e.what()), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    auto& top = st.stack.front()->items;
    if(st.stack.size()!=1 || top.size()!=1) throw parse_error(source_name + ": expected exactly one top-level form");
    auto root = to_node(*top.front());
    validate(root);
    return root;
}

} // namespace backport
