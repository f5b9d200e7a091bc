// compile_order.hpp: ordem de compilação de uma partição do repositório
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dlbuild {

struct BuildStep {
    std::string name;
    std::optional<std::string> prior;   // pacote renomeado que o upgradepkg deve substituir
};

// Uma entrada por linha: "nome" ou "anterior%nome". Linhas vazias e '#' são ignoradas.
bool parseCompileOrder(const std::string& origin, const std::string& text,
                       std::vector<BuildStep>& out, std::string& err);

bool readCompileOrder(const std::filesystem::path& path, std::vector<BuildStep>& out, std::string& err);

} // namespace dlbuild
