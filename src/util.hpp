// util.hpp: helpers de fs/strings usados por todo o dlbuild
#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dlbuild {

namespace fs = std::filesystem;

void ensureDir(const fs::path& p);
bool fileExists(const fs::path& p);

std::string trim(const std::string& s);
std::vector<std::string> splitWs(const std::string& s);
std::vector<std::string> splitCSV(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// último segmento do caminho de uma URL, sem query nem fragmento
std::string baseName(const std::string& url);
bool isUrl(const std::string& s);

// Envolve s em aspas simples para uso seguro em sh -c.
std::string shellQuote(const std::string& s);

bool readFile(const fs::path& p, std::string& out, std::string& err);

} // namespace dlbuild
