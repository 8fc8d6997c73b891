#include "backport/config.hpp"
#include "backport/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace backport {

namespace {
std::string_view trim(std::string_view s){
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}
}

std::set<std::string> parse_name_list(std::string_view text){
    std::set<std::string> out;
    while(true){
        auto comma = text.find(',');
        auto item = trim(text.substr(0, comma));
        if(!item.empty()) out.emplace(item);
        if(comma==std::string_view::npos) break;
        text.remove_prefix(comma+1);
    }
    return out;
}

bool parse_bool_setting(std::string_view name, std::string_view text){
    std::string v(trim(text));
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(v=="1" || v=="true" || v=="yes" || v=="on") return true;
    if(v=="0" || v=="false" || v=="no" || v=="off") return false;
    throw configuration_error("invalid value for " + std::string(name) + ": '" + std::string(text) + "'");
}

BuildConfig detect_build_config(){
    BuildConfig cfg;
    if(const char* v = std::getenv("BACKPORT_TARGET_VERSION")){
        if(*v) cfg.target_version = Version::parse(v);
    }
    if(const char* v = std::getenv("BACKPORT_FORCE")){
        if(*v) cfg.force = parse_bool_setting("BACKPORT_FORCE", v);
    }
    if(const char* v = std::getenv("BACKPORT_FIXERS")) cfg.fixer_allowlist = parse_name_list(v);
    if(const char* v = std::getenv("BACKPORT_CHECKERS")) cfg.checker_allowlist = parse_name_list(v);
    return cfg;
}

} // namespace backport
