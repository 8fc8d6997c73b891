#include "backport/fixers.hpp"

namespace backport {

namespace {

std::string escape_braces(const std::string& s){
    std::string out;
    out.reserve(s.size());
    for(char c : s){
        out += c;
        if(c=='{' || c=='}') out += c;
    }
    return out;
}

std::string joined_str_format(const node& joined, node_list& args);

std::string formatted_value_format(const node& fv, node_list& args){
    const size_t index = args.size();
    args.push_back(std::get<node_ptr>(field(fv, "value")));
    std::string out = "{" + std::to_string(index);
    switch(std::get<int64_t>(field(fv, "conversion"))){
        case -1: break;
        case 's': out += "!s"; break;
        case 'r': out += "!r"; break;
        case 'a': out += "!a"; break;
        default:
            throw structural_assumption_error("unknown f-string conversion " + std::to_string(std::get<int64_t>(field(fv, "conversion"))), fv);
    }
    auto spec = std::get<node_ptr>(field(fv, "format_spec"));
    if(spec){
        if(!is(spec, node_kind::JoinedStr))
            throw structural_assumption_error(std::string("unexpected ") + kind_name(spec->kind) + " as format spec", fv);
        out += ":" + joined_str_format(*spec, args);
    }
    return out + "}";
}

std::string joined_str_format(const node& joined, node_list& args){
    std::string out;
    for(auto& part : std::get<node_list>(field(joined, "values"))){
        if(is(part, node_kind::Str)) out += escape_braces(str(*part, "s"));
        else if(is(part, node_kind::FormattedValue)) out += formatted_value_format(*part, args);
        else throw structural_assumption_error(std::string("unexpected ") + kind_name(part->kind) + " in f-string", joined);
    }
    return out;
}

} // namespace

FStringToStrFormatFixer::FStringToStrFormatFixer()
    : TransformerFixer("fstring_to_str_format", VersionInfo("2.6", "3.5"))
{
    transformer_.on(node_kind::JoinedStr, [](const node_ptr& n){
        node_list args;
        auto fmt = joined_str_format(*n, args);
        auto call = n_call(n_attr(n_str(std::move(fmt)), "format"), std::move(args));
        call->line = n->line; call->col = n->col;
        return rewrite_result::replace(call);
    });
}

} // namespace backport
