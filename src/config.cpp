#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <sstream>

namespace dlbuild {

std::string Config::envOr(const char* key, const std::string& def){
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

static bool parseBool(const std::string& v, bool& out){
    if(v=="1"||v=="true"||v=="on"){ out = true; return true; }
    if(v=="0"||v=="false"||v=="off"){ out = false; return true; }
    return false;
}

static bool setKey(Config& c, const std::string& k, const std::string& v, std::string& err){
    if(k=="repos_root") c.repos_root = v;
    else if(k=="repos") c.repos = splitCSV(v);
    else if(k=="logging_directory") c.logging_directory = v;
    else if(k=="temporary_directory") c.temporary_directory = v;
    else if(k=="cache_directory") c.cache_directory = v;
    else if(k=="install_database") c.install_database = v;
    else if(k=="installer") c.installer = v;
    else if(k=="package_tag") c.package_tag = v;
    else if(k=="color"||k=="verbose"){
        bool b = false;
        if(!parseBool(v, b)){ err = "valor booleano inválido para " + k + ": " + v; return false; }
        (k=="color" ? c.color : c.verbose) = b;
    }
    else { err = "chave desconhecida: " + k; return false; }
    return true;
}

bool parseConfigText(const std::string& origin, const std::string& text, Config& c, std::string& err){
    std::istringstream in(text);
    std::string line;
    int lineno = 0;
    while(std::getline(in, line)){
        ++lineno;
        line = trim(line);
        if(line.empty() || line[0]=='#') continue;
        auto pos = line.find('=');
        if(pos==std::string::npos){
            err = origin + ":" + std::to_string(lineno) + ": esperado chave=valor";
            return false;
        }
        std::string k = trim(line.substr(0,pos)), v = trim(line.substr(pos+1));
        std::string why;
        if(!setKey(c, k, v, why)){
            err = origin + ":" + std::to_string(lineno) + ": " + why;
            return false;
        }
    }
    return true;
}

bool applyEnv(Config& c, std::string& err){
    static const std::pair<const char*, const char*> vars[] = {
        {"DLBUILD_REPOS_ROOT",    "repos_root"},
        {"DLBUILD_REPOS",         "repos"},
        {"DLBUILD_LOGGING_DIR",   "logging_directory"},
        {"DLBUILD_TEMPORARY_DIR", "temporary_directory"},
        {"DLBUILD_CACHE_DIR",     "cache_directory"},
        {"DLBUILD_INSTALL_DB",    "install_database"},
        {"DLBUILD_INSTALLER",     "installer"},
        {"DLBUILD_TAG",           "package_tag"},
        {"DLBUILD_COLOR",         "color"},
        {"DLBUILD_VERBOSE",       "verbose"},
    };
    for(const auto& [env, key]: vars){
        const char* v = std::getenv(env);
        if(!v) continue;
        std::string why;
        if(!setKey(c, key, v, why)){
            err = std::string(env) + ": " + why;
            return false;
        }
    }
    return true;
}

bool loadConfig(const fs::path& rc, bool required, Config& out, std::string& err){
    Config c;
    if(fileExists(rc)){
        std::string text;
        if(!readFile(rc, text, err)) return false;
        if(!parseConfigText(rc.string(), text, c, err)) return false;
    } else if(required){
        err = rc.string() + ": arquivo de configuração não encontrado";
        return false;
    }
    if(!applyEnv(c, err)) return false;
    // os passos trocam o diretório atual; caminhos relativos valem a partir daqui
    for(fs::path* p: {&c.repos_root, &c.logging_directory, &c.temporary_directory,
                      &c.cache_directory, &c.install_database}){
        *p = fs::absolute(*p).lexically_normal();
    }
    out = c;
    return true;
}

std::vector<fs::path> compileOrders(const Config& c){
    std::vector<fs::path> v;
    for(const auto& r: c.repos) v.push_back(c.repos_root / r);
    return v;
}

} // namespace dlbuild
