// process.hpp: execução de comandos externos com a saída enviada a um ByteSink
#pragma once

#include "sink.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dlbuild {

struct Command {
    std::vector<std::string> argv;
    std::vector<std::pair<std::string, std::string>> env;   // acrescentadas ao ambiente herdado
};

// Linha de shell equivalente, com tudo entre aspas: VAR='v' 'prog' 'arg'
std::string renderCommand(const Command& cmd);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    // Executa cmd no diretório atual, com stdout e stderr combinados em out.
    // Retorna o código de saída: 127 se não foi possível iniciar, 128+N se
    // morto pelo sinal N. sink_ok fica false se algum write em out falhou;
    // a saída do filho é lida até o fim mesmo assim.
    virtual int run(const Command& cmd, ByteSink& out, bool& sink_ok) = 0;
};

// popen("... 2>&1") lendo blocos de 4 KiB
class ShellRunner : public CommandRunner {
public:
    int run(const Command& cmd, ByteSink& out, bool& sink_ok) override;
};

} // namespace dlbuild
