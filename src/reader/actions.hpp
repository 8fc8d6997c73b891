#pragma once
#include "grammar.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <tao/pegtl.hpp>

namespace backport::reader {

// Untyped form as read from text, before it is matched against node schemas.
struct form {
    enum class type { nil, boolean, integer, floating, string, keyword, symbol, list, vector };
    type t = type::nil;
    bool b = false;
    int64_t i = 0;
    double d = 0.0;
    std::string s;
    std::vector<std::shared_ptr<form>> items;
    int line = -1;
    int col = -1;
};
using form_ptr = std::shared_ptr<form>;

struct read_state {
    // open collections; the bottom frame collects the document's value
    std::vector<form_ptr> stack{std::make_shared<form>()};

    void push(form_ptr f){ stack.back()->items.push_back(std::move(f)); }
};

namespace actions {
using namespace tao::pegtl;

template<typename Input>
form_ptr make_form(const Input& in, form::type t){
    auto f = std::make_shared<form>();
    f->t = t;
    auto p = in.position();
    f->line = static_cast<int>(p.line);
    f->col = static_cast<int>(p.column);
    return f;
}

std::string unescape(const std::string& quoted);

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::nil_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){ st.push(make_form(in, form::type::nil)); }
};

template<> struct action< grammar::true_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){ auto f = make_form(in, form::type::boolean); f->b = true; st.push(f); }
};

template<> struct action< grammar::false_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){ st.push(make_form(in, form::type::boolean)); }
};

template<> struct action< grammar::integer_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        auto f = make_form(in, form::type::integer);
        try { f->i = std::stoll(in.string()); }
        catch(const std::out_of_range&) { throw tao::pegtl::parse_error("integer out of range", in); }
        st.push(f);
    }
};

template<> struct action< grammar::float_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        auto f = make_form(in, form::type::floating);
        try { f->d = std::stod(in.string()); }
        catch(const std::out_of_range&) { throw tao::pegtl::parse_error("float out of range", in); }
        st.push(f);
    }
};

template<> struct action< grammar::string_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        auto f = make_form(in, form::type::string);
        f->s = unescape(in.string());
        st.push(f);
    }
};

template<> struct action< grammar::keyword > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        auto f = make_form(in, form::type::keyword);
        f->s = in.string().substr(1);
        st.push(f);
    }
};

template<> struct action< grammar::symbol > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        auto f = make_form(in, form::type::symbol);
        f->s = in.string();
        st.push(f);
    }
};

template<> struct action< grammar::list_open > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){ st.stack.push_back(make_form(in, form::type::list)); }
};

template<> struct action< grammar::vector_open > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){ st.stack.push_back(make_form(in, form::type::vector)); }
};

struct close_collection {
    template<typename Input>
    static void apply(const Input&, read_state& st){
        auto f = st.stack.back();
        st.stack.pop_back();
        st.push(f);
    }
};
template<> struct action< grammar::list_close > : close_collection {};
template<> struct action< grammar::vector_close > : close_collection {};

} // namespace actions
} // namespace backport::reader
