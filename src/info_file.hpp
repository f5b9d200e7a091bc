// info_file.hpp: descrição de pacote (<nome>.info, formato SlackBuilds.org)
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dlbuild {

struct PackageDescriptor {
    std::string name;
    std::string version;
    std::string homepage;
    std::vector<std::string> downloads;
    std::vector<std::string> checksums;   // md5 em hex minúsculo, pareado com downloads
};

// Linhas KEY="valor"; dentro das aspas, '\' no fim da linha continua o valor.
// PKGNAM, VERSION, HOMEPAGE, DOWNLOAD e MD5SUM são obrigatórias, outras chaves
// são ignoradas. Em erro retorna false e err = "origin:linha: mensagem".
bool parseInfoFile(const std::string& origin, const std::string& text,
                   PackageDescriptor& out, std::string& err);

bool readInfoFile(const std::filesystem::path& path, PackageDescriptor& out, std::string& err);

} // namespace dlbuild
