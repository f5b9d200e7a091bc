#include "package_error.hpp"

namespace dlbuild {

const char* errorKindName(ErrorKind k){
    switch(k){
        case ErrorKind::Parse:               return "ParseError";
        case ErrorKind::UnsupportedDownload: return "UnsupportedDownload";
        case ErrorKind::Download:            return "DownloadError";
        case ErrorKind::ChecksumMismatch:    return "ChecksumMismatch";
        case ErrorKind::Build:               return "BuildError";
        case ErrorKind::Install:             return "InstallError";
        case ErrorKind::Log:                 return "LogError";
    }
    return "UnknownError";
}

std::string describe(const PackageError& e){
    std::string msg;
    switch(e.kind){
        case ErrorKind::Parse:
            msg = "Falha ao interpretar a descrição de " + e.package; break;
        case ErrorKind::UnsupportedDownload:
            msg = "Tipo de download não suportado em " + e.package; break;
        case ErrorKind::Download:
            msg = "Falha ao baixar as fontes de " + e.package; break;
        case ErrorKind::ChecksumMismatch:
            msg = "Checksum não confere para " + e.package; break;
        case ErrorKind::Build:
            msg = "Falha ao compilar " + e.package; break;
        case ErrorKind::Install:
            msg = "Falha ao instalar " + e.package; break;
        case ErrorKind::Log:
            msg = "Falha ao gravar o log de " + e.package; break;
    }
    if(!e.detail.empty()) msg += ":\n" + e.detail;
    return msg;
}

} // namespace dlbuild
