#include "util.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace dlbuild {

void ensureDir(const fs::path& p){
    std::error_code ec; fs::create_directories(p, ec);
}

bool fileExists(const fs::path& p){
    std::error_code ec; return fs::exists(p, ec);
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b<e && std::isspace((unsigned char)s[b])) ++b;
    while(e>b && std::isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e-b);
}

std::vector<std::string> splitWs(const std::string& s){
    std::vector<std::string> out; std::istringstream iss(s); std::string x;
    while(iss >> x) out.push_back(x);
    return out;
}

std::vector<std::string> splitCSV(const std::string& s){
    std::vector<std::string> out; std::istringstream iss(s); std::string x;
    while(std::getline(iss, x, ',')){
        x = trim(x);
        if(!x.empty()) out.push_back(x);
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep){
    std::string r;
    for(size_t i=0;i<parts.size();++i){ if(i) r += sep; r += parts[i]; }
    return r;
}

std::string baseName(const std::string& url){
    std::string s = url;
    auto cut = s.find_first_of("?#");
    if(cut!=std::string::npos) s.erase(cut);
    auto pos = s.find_last_of('/');
    if(pos==std::string::npos) return s;
    return s.substr(pos+1);
}

bool isUrl(const std::string& s){
    return s.rfind("http://",0)==0 || s.rfind("https://",0)==0;
}

std::string shellQuote(const std::string& s){
    std::string r = "'";
    for(char c: s){
        if(c=='\'') r += "'\\''";
        else r.push_back(c);
    }
    r += "'";
    return r;
}

bool readFile(const fs::path& p, std::string& out, std::string& err){
    std::ifstream in(p, std::ios::binary);
    if(!in){
        err = p.string() + ": " + std::strerror(errno);
        return false;
    }
    std::ostringstream ss; ss << in.rdbuf();
    if(in.bad()){
        err = p.string() + ": erro de leitura";
        return false;
    }
    out = ss.str();
    return true;
}

} // namespace dlbuild
