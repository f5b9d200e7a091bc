// arch.hpp: arquitetura do host e número de build lidos do SlackBuild
#pragma once

#include <filesystem>
#include <string>

namespace dlbuild {

struct BuildInfo {
    std::string arch;
    std::string build = "1";
};

// i?86 -> i586, arm* -> arm, demais inalterados (mesma regra dos SlackBuilds)
std::string normalizeMachine(const std::string& machine);

// uname(2), normalizado
std::string hostArch();

// BUILD=${BUILD:-N} define o build. Um ARCH literal (ex.: ARCH=noarch ou
// ARCH=${ARCH:-noarch}) vale sobre host_arch; atribuições que dependem de
// uname ou de outras variáveis são ignoradas.
BuildInfo probeSlackBuild(const std::string& host_arch, const std::string& script);

bool readSlackBuild(const std::filesystem::path& script, const std::string& host_arch,
                    BuildInfo& out, std::string& err);

} // namespace dlbuild
