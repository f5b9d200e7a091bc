#include "process.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdio>
#include <sys/wait.h>
#include <unistd.h>

namespace dlbuild {

std::string renderCommand(const Command& cmd){
    std::vector<std::string> parts;
    for(const auto& [k, v]: cmd.env) parts.push_back(k + "=" + shellQuote(v));
    for(const auto& a: cmd.argv) parts.push_back(shellQuote(a));
    return join(parts, " ");
}

int ShellRunner::run(const Command& cmd, ByteSink& out, bool& sink_ok){
    sink_ok = true;
    if(cmd.argv.empty()) return 127;

    std::string full = renderCommand(cmd) + " 2>&1";
    logDebug(full);

    FILE* pipe = popen(full.c_str(), "r");
    if(!pipe) return 127;

    // read(2) direto no fd: entrega o que o filho já escreveu, sem esperar encher o bloco
    int fd = fileno(pipe);
    char buffer[4096];
    for(;;){
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if(n < 0 && errno == EINTR) continue;
        if(n <= 0) break;
        if(!out.write(buffer, static_cast<size_t>(n))) sink_ok = false;
    }
    int status = pclose(pipe);

    if(status == -1) return 127;
    if(WIFEXITED(status)) return WEXITSTATUS(status);
    if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 127;
}

} // namespace dlbuild
