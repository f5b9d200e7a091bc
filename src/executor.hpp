// executor.hpp: SlackBuild e upgradepkg
#pragma once

#include "arch.hpp"
#include "context.hpp"
#include "info_file.hpp"
#include "package_error.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dlbuild {

// nome-versão-arch-build_tag
std::string fullPackageName(const PackageDescriptor& pkg, const BuildInfo& info, const std::string& tag);

std::filesystem::path buildLogPath(const Config& c, const PackageDescriptor& pkg);

// sh ./<nome>.SlackBuild com VERSION no ambiente, no diretório atual.
// A saída vai ao mesmo tempo para ctx.console e para o log do pacote.
std::optional<PackageError> runBuildScript(PackageContext& ctx, const PackageDescriptor& pkg);

// upgradepkg --reinstall --install-new [anterior%]<cache>/<full_name>.txz
std::optional<PackageError> installArtifact(PackageContext& ctx, const std::string& package,
                                            const std::string& full_name,
                                            const std::optional<std::string>& prior);

} // namespace dlbuild
