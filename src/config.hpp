// config.hpp: padrões, arquivo rc (chave=valor) e variáveis DLBUILD_*
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dlbuild {

namespace fs = std::filesystem;

struct Config {
    fs::path repos_root = ".";
    std::vector<std::string> repos;          // compile orders, relativos a repos_root
    fs::path logging_directory = "/tmp/dlackware/log";
    fs::path temporary_directory = "/tmp/dlackware";
    fs::path cache_directory = "/var/cache/dlackware";
    fs::path install_database = "/var/lib/pkgtools/packages";
    std::string installer = "/sbin/upgradepkg";
    std::string package_tag = "dlack";
    bool color = true;
    bool verbose = false;

    static std::string envOr(const char* key, const std::string& def);
};

constexpr const char* kDefaultConfigPath = "etc/dlbuild.conf";

// Aplica as linhas chave=valor de text sobre c. origin aparece nas mensagens de erro.
bool parseConfigText(const std::string& origin, const std::string& text, Config& c, std::string& err);

// Sobrescreve c com as variáveis DLBUILD_* presentes no ambiente.
bool applyEnv(Config& c, std::string& err);

// padrões -> rc -> ambiente. Se required, a ausência do rc é erro.
bool loadConfig(const fs::path& rc, bool required, Config& out, std::string& err);

std::vector<fs::path> compileOrders(const Config& c);

} // namespace dlbuild
