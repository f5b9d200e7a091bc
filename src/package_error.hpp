// package_error.hpp: falhas que interrompem uma ordem de compilação
#pragma once

#include <string>

namespace dlbuild {

enum class ErrorKind {
    Parse,
    UnsupportedDownload,
    Download,
    ChecksumMismatch,
    Build,
    Install,
    Log,          // log do build não pôde ser criado ou gravado
};

struct PackageError {
    ErrorKind kind;
    std::string package;
    std::string detail;
};

const char* errorKindName(ErrorKind k);
std::string describe(const PackageError& e);

} // namespace dlbuild
