// package.hpp: ações aplicadas a um pacote (download, build e install)
#pragma once

#include "context.hpp"
#include "info_file.hpp"
#include "package_error.hpp"

#include <optional>
#include <string>

namespace dlbuild {

enum class Action { Download, Build, Install };

const char* actionName(Action a);

// Todas as ações rodam no diretório do pacote (o diretório atual).

// Baixa, em série e na ordem declarada, as fontes sem cache válido e confere
// os MD5 de uma vez: qualquer diferença gera um único ChecksumMismatch.
std::optional<PackageError> downloadSources(PackageContext& ctx, const PackageDescriptor& pkg,
                                            const std::optional<std::string>& prior);

// Nada a fazer se o pacote já consta no banco do pkgtools; senão
// download -> SlackBuild -> upgradepkg.
std::optional<PackageError> buildPackage(PackageContext& ctx, const PackageDescriptor& pkg,
                                         const std::optional<std::string>& prior);

// Reinstala o .txz já gerado, sem compilar.
std::optional<PackageError> installPackage(PackageContext& ctx, const PackageDescriptor& pkg,
                                           const std::optional<std::string>& prior);

std::optional<PackageError> applyAction(Action a, PackageContext& ctx, const PackageDescriptor& pkg,
                                        const std::optional<std::string>& prior);

} // namespace dlbuild
