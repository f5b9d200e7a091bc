#include "compile_order.hpp"
#include "util.hpp"

#include <cctype>
#include <sstream>

namespace dlbuild {

static bool validName(const std::string& s){
    // "." e ".." sairiam do diretório do repositório
    if(s.find_first_not_of('.')==std::string::npos) return false;
    for(char c: s){
        if(!(std::isalnum((unsigned char)c) || c=='-'||c=='_'||c=='.'||c=='+')) return false;
    }
    return true;
}

bool parseCompileOrder(const std::string& origin, const std::string& text,
                       std::vector<BuildStep>& out, std::string& err){
    std::vector<BuildStep> steps;
    std::istringstream in(text);
    std::string line;
    int lineno = 0;
    while(std::getline(in, line)){
        ++lineno;
        line = trim(line);
        if(line.empty() || line[0]=='#') continue;

        std::string at = origin + ":" + std::to_string(lineno) + ": ";
        BuildStep step;
        auto pct = line.find('%');
        if(pct==std::string::npos){
            step.name = line;
        } else {
            if(line.find('%', pct+1)!=std::string::npos){
                err = at + "mais de um '%' em " + line;
                return false;
            }
            step.prior = line.substr(0, pct);
            step.name = line.substr(pct+1);
            if(!validName(*step.prior)){
                err = at + "nome anterior inválido em " + line;
                return false;
            }
        }
        if(!validName(step.name)){
            err = at + "nome de pacote inválido: " + line;
            return false;
        }
        steps.push_back(step);
    }
    out = std::move(steps);
    return true;
}

bool readCompileOrder(const std::filesystem::path& path, std::vector<BuildStep>& out, std::string& err){
    std::string text;
    if(!readFile(path, text, err)) return false;
    return parseCompileOrder(path.string(), text, out, err);
}

} // namespace dlbuild
