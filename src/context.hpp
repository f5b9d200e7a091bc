// context.hpp: contexto somente leitura compartilhado por todas as ações
#pragma once

#include "config.hpp"
#include "download.hpp"
#include "process.hpp"

#include <ostream>
#include <string>

namespace dlbuild {

// Montado uma vez por execução.
struct RunEnvironment {
    std::string arch;
    Config config;
};

struct PackageContext {
    const RunEnvironment& env;
    Transport& transport;
    CommandRunner& runner;
    std::ostream& console;   // recebe a saída dos SlackBuilds e do upgradepkg
};

} // namespace dlbuild
