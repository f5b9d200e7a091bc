#include "info_file.hpp"
#include "checksum.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace dlbuild {

static bool validKey(const std::string& k){
    if(k.empty()) return false;
    for(char c: k){
        if(!(std::isupper((unsigned char)c) || std::isdigit((unsigned char)c) || c=='_')) return false;
    }
    return true;
}

static std::string where(const std::string& origin, int line){
    return origin + ":" + std::to_string(line) + ": ";
}

bool parseInfoFile(const std::string& origin, const std::string& text,
                   PackageDescriptor& out, std::string& err){
    std::vector<std::string> lines;
    {
        std::istringstream in(text); std::string l;
        while(std::getline(in, l)){
            if(!l.empty() && l.back()=='\r') l.pop_back();
            lines.push_back(l);
        }
    }

    std::map<std::string, std::string> kv;
    std::map<std::string, int> key_line;
    size_t i = 0;
    while(i < lines.size()){
        int lineno = static_cast<int>(i) + 1;
        std::string line = trim(lines[i]);
        ++i;
        if(line.empty() || line[0]=='#') continue;

        auto eq = line.find('=');
        if(eq==std::string::npos || !validKey(line.substr(0, eq))){
            err = where(origin, lineno) + "esperado CHAVE=\"valor\"";
            return false;
        }
        std::string key = line.substr(0, eq);
        std::string rest = line.substr(eq+1);
        if(rest.empty() || rest[0]!='"'){
            err = where(origin, lineno) + "valor de " + key + " deve estar entre aspas";
            return false;
        }
        rest.erase(0, 1);

        std::string value;
        for(;;){
            auto q = rest.find('"');
            if(q!=std::string::npos){
                value += rest.substr(0, q);
                std::string tail = trim(rest.substr(q+1));
                if(!tail.empty() && tail[0]!='#'){
                    err = where(origin, static_cast<int>(i)) + "texto após o fim do valor de " + key;
                    return false;
                }
                break;
            }
            if(i >= lines.size()){
                err = where(origin, lineno) + "aspas não fechadas no valor de " + key;
                return false;
            }
            if(!rest.empty() && rest.back()=='\\'){
                rest.pop_back();
                value += rest;
            } else {
                value += rest + "\n";
            }
            rest = lines[i++];
        }

        if(kv.count(key)){
            err = where(origin, lineno) + key + " repetida (primeira na linha "
                + std::to_string(key_line[key]) + ")";
            return false;
        }
        kv[key] = value;
        key_line[key] = lineno;
    }

    for(const char* req: {"PKGNAM", "VERSION", "HOMEPAGE", "DOWNLOAD", "MD5SUM"}){
        if(!kv.count(req)){
            err = origin + ": falta a chave " + req;
            return false;
        }
    }

    PackageDescriptor pkg;
    pkg.name = trim(kv["PKGNAM"]);
    pkg.version = trim(kv["VERSION"]);
    pkg.homepage = trim(kv["HOMEPAGE"]);
    pkg.downloads = splitWs(kv["DOWNLOAD"]);
    pkg.checksums = splitWs(kv["MD5SUM"]);

    if(pkg.name.empty()){ err = where(origin, key_line["PKGNAM"]) + "PKGNAM vazio"; return false; }
    if(pkg.version.empty()){ err = where(origin, key_line["VERSION"]) + "VERSION vazio"; return false; }

    for(auto& sum: pkg.checksums){
        if(!isMd5Hex(sum)){
            err = where(origin, key_line["MD5SUM"]) + "checksum MD5 inválido: " + sum;
            return false;
        }
        std::transform(sum.begin(), sum.end(), sum.begin(), [](unsigned char c){ return std::tolower(c); });
    }
    if(pkg.downloads.size() != pkg.checksums.size()){
        err = where(origin, key_line["MD5SUM"]) + "DOWNLOAD tem " + std::to_string(pkg.downloads.size())
            + " entradas e MD5SUM tem " + std::to_string(pkg.checksums.size());
        return false;
    }

    out = std::move(pkg);
    return true;
}

bool readInfoFile(const std::filesystem::path& path, PackageDescriptor& out, std::string& err){
    std::string text;
    if(!readFile(path, text, err)) return false;
    return parseInfoFile(path.string(), text, out, err);
}

} // namespace dlbuild
