#include "backport/diagnostics_json.hpp"
#include "backport/features.hpp"
#include <sstream>
#include <cstdio>

namespace backport {

Diagnostic to_diagnostic(const error& e){
    return Diagnostic{e.code(), e.what(), e.line(), e.col()};
}

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& diags){
    std::ostringstream os;
    os<<"{\"success\":"<<(diags.empty()?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<diags.size(); ++i){
        const auto &d=diags[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<"}";
    }
    os<<"]}";
    return os.str();
}

bool maybe_print_json(const std::vector<Diagnostic>& diags){
    if(!diag_json_enabled()) return false;
    auto js=diagnostics_to_json(diags);
    std::fprintf(stderr, "%s\n", js.c_str());
    return true;
}

} // namespace backport
