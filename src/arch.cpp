#include "arch.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <sys/utsname.h>

namespace dlbuild {

std::string normalizeMachine(const std::string& machine){
    if(std::regex_match(machine, std::regex("i.86"))) return "i586";
    if(machine.rfind("arm",0)==0) return "arm";
    return machine;
}

std::string hostArch(){
    struct utsname u{};
    if(uname(&u)!=0) return "unknown";
    return normalizeMachine(u.machine);
}

static bool isLiteral(const std::string& v){
    return !v.empty() && v.find_first_of("$`\"'(") == std::string::npos;
}

// Variação de profundidade de blocos case/if causada por uma linha.
static int blockDelta(const std::string& line){
    int d = 0;
    std::string word;
    auto flush = [&]{
        if(word=="case" || word=="if") ++d;
        else if(word=="esac" || word=="fi") --d;
        word.clear();
    };
    for(char c: line){
        if(c=='#' && word.empty()) break;
        if(std::isspace((unsigned char)c) || c==';' || c=='&' || c=='|') flush();
        else word.push_back(c);
    }
    flush();
    return d;
}

BuildInfo probeSlackBuild(const std::string& host_arch, const std::string& script){
    static const std::regex defaulted("^(?:export\\s+)?(BUILD|ARCH)=\\$\\{\\1:-([^}]*)\\}\\s*(?:#.*)?$");
    static const std::regex plain("^(?:export\\s+)?(BUILD|ARCH)=(\\S+)\\s*(?:#.*)?$");

    BuildInfo info;
    info.arch = host_arch;
    bool have_build = false, have_arch = false;
    int depth = 0;

    std::istringstream in(script);
    std::string line;
    while(std::getline(in, line)){
        line = trim(line);
        int level = depth;
        depth = std::max(0, depth + blockDelta(line));

        std::smatch m;
        if(!std::regex_match(line, m, defaulted) && !std::regex_match(line, m, plain)) continue;
        std::string v = m[2];
        if(!isLiteral(v)) continue;
        if(m[1]=="BUILD" && !have_build){ info.build = v; have_build = true; }
        // ARCH dentro de case/if vale só para outro host
        else if(m[1]=="ARCH" && !have_arch && level==0){ info.arch = v; have_arch = true; }
    }
    return info;
}

bool readSlackBuild(const std::filesystem::path& script, const std::string& host_arch,
                    BuildInfo& out, std::string& err){
    std::string text;
    if(!readFile(script, text, err)) return false;
    out = probeSlackBuild(host_arch, text);
    return true;
}

} // namespace dlbuild
