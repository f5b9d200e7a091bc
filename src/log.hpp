// log.hpp: saída colorida no console (stderr)
#pragma once

#include <mutex>
#include <string>

namespace dlbuild {

namespace ansi {
    constexpr const char* reset   = "\033[0m";
    constexpr const char* bold    = "\033[1m";
    constexpr const char* dim     = "\033[2m";
    constexpr const char* red     = "\033[31m";
    constexpr const char* green   = "\033[32m";
    constexpr const char* yellow  = "\033[33m";
}

void setLogColor(bool on);
void setLogVerbose(bool on);

// Serializa tudo que vai para o terminal: mensagens e saída dos SlackBuilds.
std::mutex& consoleMutex();

void logInfo(const std::string& s);
void logWarn(const std::string& s);
void logErr(const std::string& s);
void logFatal(const std::string& s);
void logDebug(const std::string& s);

} // namespace dlbuild
