// dlbuild: compila e instala as árvores de SlackBuilds na ordem declarada
//
// Uso:
//    dlbuild [--config ARQ] [--no-color] [--verbose] build|download|install
//
// Cada entrada de "repos" na configuração aponta uma ordem de compilação
// (relativa a repos_root). Os pacotes são processados estritamente nessa
// ordem e o primeiro erro encerra a execução com status 1.

#include "arch.hpp"
#include "config.hpp"
#include "context.hpp"
#include "download.hpp"
#include "log.hpp"
#include "package.hpp"
#include "process.hpp"
#include "sequencer.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace dlbuild;

// ========================= Ajuda =========================
static void usage(){
    std::cout << "dlbuild: compilação de pacotes a partir das ordens de compilação\n\n"
              << "Comandos:\n"
              << "  build|b       baixa, compila e instala os pacotes que ainda não estão instalados\n"
              << "  download|d    apenas baixa e confere as fontes\n"
              << "  install|i     reinstala os pacotes já gerados em cache_directory\n"
              << "  help|h\n\n"
              << "Flags: --config ARQ (padrão $DLBUILD_CONFIG ou " << kDefaultConfigPath << ")\n"
              << "       --no-color | --verbose\n";
}

static std::optional<Action> parseCommand(const std::string& cmd){
    if(cmd=="build"||cmd=="b") return Action::Build;
    if(cmd=="download"||cmd=="d") return Action::Download;
    if(cmd=="install"||cmd=="i") return Action::Install;
    return std::nullopt;
}

// ========================= Parser simples =========================
int main(int argc, char** argv){
    std::vector<std::string> args(argv+1, argv+argc);

    auto eatFlag = [&](const std::string& f){
        auto it = std::find(args.begin(), args.end(), f);
        if(it!=args.end()){ args.erase(it); return true; } return false;
    };
    auto getOpt = [&](const std::string& key)->std::optional<std::string>{
        for(size_t i=0;i+1<args.size();++i){
            if(args[i]==key){
                auto v=args[i+1];
                args.erase(args.begin()+i, args.begin()+i+2);
                return v;
            }
        }
        return std::nullopt;
    };

    bool no_color = eatFlag("--no-color");
    bool verbose = eatFlag("--verbose");
    auto config_opt = getOpt("--config");

    if(args.empty()){ usage(); return 2; }
    std::string cmd = args.front(); args.erase(args.begin());
    if(cmd=="help"||cmd=="h"){ usage(); return 0; }

    auto action = parseCommand(cmd);
    if(!action || !args.empty()){
        logErr(action ? "Argumento inesperado: " + args.front() : "Comando desconhecido: " + cmd);
        usage();
        return 2;
    }

    // Carregar config; o caminho padrão pode não existir
    std::string env_config = Config::envOr("DLBUILD_CONFIG", "");
    bool explicit_config = config_opt || !env_config.empty();
    std::string config_path = config_opt ? *config_opt : (!env_config.empty() ? env_config : kDefaultConfigPath);

    Config cfg;
    std::string err;
    if(!loadConfig(config_path, explicit_config, cfg, err)){
        logFatal(err);
        return 1;
    }
    if(no_color) cfg.color = false;
    if(verbose) cfg.verbose = true;
    setLogColor(cfg.color);
    setLogVerbose(cfg.verbose);

    if(cfg.repos.empty()){
        logFatal("Nenhuma ordem de compilação configurada (chave repos)");
        return 1;
    }

    try{
        const RunEnvironment env{hostArch(), cfg};
        CurlTransport transport;
        ShellRunner runner;
        PackageContext ctx{env, transport, runner, std::cout};

        if(auto e = runAll(ctx, *action)){
            logFatal(describe(*e));
            return 1;
        }
    }catch(const std::exception& ex){
        logFatal(ex.what());
        return 1;
    }
    logInfo("Concluído");
    return 0;
}
