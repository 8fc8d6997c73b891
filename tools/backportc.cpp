#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "backport/config.hpp"
#include "backport/diagnostics_json.hpp"
#include "backport/pipeline.hpp"
#include "backport/reader.hpp"

using namespace backport;

static const char* kUsage =
    "usage: backportc [--target=V] [--fixers=a,b] [--checkers=a,b] [--force|--no-force]\n"
    "                 [--pretty] [--list] <tree-file>\n";

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

static bool starts_with(const std::string& s, const char* prefix, std::string& rest){
    std::string p(prefix);
    if(s.compare(0, p.size(), p)!=0) return false;
    rest = s.substr(p.size());
    return true;
}

static void list_catalog(const FixerRegistry& fixers, const CheckerRegistry& checkers, const Version& target){
    auto mark = [&](const VersionInfo& info){ return info.is_required_for(target) ? "*" : " "; };
    std::cout << "fixers (* = selected for " << target.to_string() << "):\n";
    for(auto& e : fixers.entries()) std::cout << "  " << mark(e.info) << " " << e.name << "  " << e.info.to_string() << "\n";
    std::cout << "checkers:\n";
    for(auto& e : checkers.entries()) std::cout << "  " << mark(e.info) << " " << e.name << "  " << e.info.to_string() << "\n";
}

static int report(const error& e){
    auto d = to_diagnostic(e);
    if(maybe_print_json({d})) return 2;
    std::cerr << "error[" << d.code << "]: " << d.message;
    if(d.line>=0) std::cerr << " (line " << d.line << ":" << d.col << ")";
    std::cerr << "\n";
    return 2;
}

int main(int argc, char** argv){
    BuildConfig cfg;
    try { cfg = detect_build_config(); }
    catch(const error& e){ report(e); return 1; }

    bool pretty = false, list = false;
    std::string file;
    for(int i=1;i<argc;++i){
        std::string a = argv[i], v;
        try {
            if(starts_with(a, "--target=", v)) cfg.target_version = Version::parse(v);
            else if(starts_with(a, "--fixers=", v)) cfg.fixer_allowlist = parse_name_list(v);
            else if(starts_with(a, "--checkers=", v)) cfg.checker_allowlist = parse_name_list(v);
            else if(a=="--force") cfg.force = true;
            else if(a=="--no-force") cfg.force = false;
            else if(a=="--pretty") pretty = true;
            else if(a=="--list") list = true;
            else if(a=="-h" || a=="--help"){ std::cout << kUsage; return 0; }
            else if(!a.empty() && a[0]=='-'){ std::cerr << "unknown option " << a << "\n" << kUsage; return 1; }
            else if(file.empty()) file = a;
            else { std::cerr << kUsage; return 1; }
        } catch(const error& e){ report(e); return 1; }
    }

    auto fixers = default_fixer_registry();
    auto checkers = default_checker_registry();
    if(list){ list_catalog(fixers, checkers, cfg.target_version); return 0; }
    if(file.empty()){ std::cerr << kUsage; return 1; }

    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read " << file << "\n"; return 1; }

    try {
        auto tree = read_tree(src, file);
        auto result = transpile_module(cfg, fixers, checkers, tree);
        prepend_imports(result.tree, result.imports);
        std::cout << (pretty ? to_pretty_string(result.tree) : to_string(result.tree)) << "\n";
    } catch(const error& e){
        return report(e);
    }
    return 0;
}
