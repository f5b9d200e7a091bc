// sequencer.hpp: percorre as ordens de compilação, parando na primeira falha
#pragma once

#include "compile_order.hpp"
#include "context.hpp"
#include "info_file.hpp"
#include "package.hpp"
#include "package_error.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dlbuild {

namespace fs = std::filesystem;

// Troca o diretório atual e restaura o anterior no destrutor.
class WorkingDirectory {
public:
    WorkingDirectory() = default;
    ~WorkingDirectory();
    WorkingDirectory(const WorkingDirectory&) = delete;
    WorkingDirectory& operator=(const WorkingDirectory&) = delete;

    bool enter(const fs::path& dir, std::string& err);

private:
    fs::path previous_;
    bool entered_ = false;
};

// Lê <repo>/<nome>/<nome>.info
std::optional<PackageError> resolveDescriptor(const fs::path& repo, const std::string& name,
                                              PackageDescriptor& out);

std::optional<PackageError> runStep(PackageContext& ctx, Action action, const fs::path& repo,
                                    const BuildStep& step);

// Executa os passos em ordem; o primeiro erro encerra a ordem e é retornado.
std::optional<PackageError> runCompileOrder(PackageContext& ctx, Action action,
                                            const fs::path& compile_order);

// Todas as ordens configuradas, em ordem; para na primeira com erro.
std::optional<PackageError> runAll(PackageContext& ctx, Action action);

} // namespace dlbuild
