#include "package.hpp"
#include "arch.hpp"
#include "checksum.hpp"
#include "download.hpp"
#include "executor.hpp"
#include "log.hpp"
#include "util.hpp"

#include <filesystem>
#include <vector>

namespace dlbuild {

namespace fs = std::filesystem;

const char* actionName(Action a){
    switch(a){
        case Action::Download: return "download";
        case Action::Build:    return "build";
        case Action::Install:  return "install";
    }
    return "?";
}

std::optional<PackageError> downloadSources(PackageContext& ctx, const PackageDescriptor& pkg,
                                            const std::optional<std::string>& /*prior*/){
    logInfo("Baixando as fontes de " + pkg.name);

    // URLs não suportadas são recusadas antes de qualquer acesso à rede
    for(const auto& url: pkg.downloads){
        if(!isSupportedUrl(url)) return PackageError{ErrorKind::UnsupportedDownload, pkg.name, url};
    }

    SourceFetcher fetcher(ctx.transport, fs::current_path());
    struct Fetched { size_t index; std::string digest; };
    std::vector<Fetched> fetched;
    for(size_t i=0;i<pkg.downloads.size();++i){
        std::string digest, err;
        switch(fetcher.ensureSource(pkg.downloads[i], pkg.checksums[i], digest, err)){
            case SourceFetcher::Status::Cached:
                break;
            case SourceFetcher::Status::Fetched:
                fetched.push_back({i, digest});
                break;
            case SourceFetcher::Status::Unsupported:
                return PackageError{ErrorKind::UnsupportedDownload, pkg.name, err};
            case SourceFetcher::Status::Failed:
                return PackageError{ErrorKind::Download, pkg.name, err};
        }
    }

    std::vector<std::string> bad;
    for(const auto& f: fetched){
        if(checksumMatches(f.digest, pkg.checksums[f.index])) continue;
        bad.push_back(cacheFilename(pkg.downloads[f.index]) + ": esperado " + pkg.checksums[f.index]
                      + ", obtido " + f.digest);
    }
    if(!bad.empty()) return PackageError{ErrorKind::ChecksumMismatch, pkg.name, join(bad, "\n")};
    return std::nullopt;
}

static bool probe(PackageContext& ctx, const PackageDescriptor& pkg, BuildInfo& info, std::string& err){
    return readSlackBuild(fs::current_path() / (pkg.name + ".SlackBuild"), ctx.env.arch, info, err);
}

std::optional<PackageError> buildPackage(PackageContext& ctx, const PackageDescriptor& pkg,
                                         const std::optional<std::string>& prior){
    BuildInfo info;
    std::string err;
    if(!probe(ctx, pkg, info, err)) return PackageError{ErrorKind::Build, pkg.name, err};

    const Config& c = ctx.env.config;
    std::string full = fullPackageName(pkg, info, c.package_tag);
    if(fileExists(c.install_database / full)){
        logInfo("Pacote já instalado: " + full);
        return std::nullopt;
    }

    logInfo("Compilando o pacote " + pkg.name);
    if(auto e = downloadSources(ctx, pkg, prior)) return e;
    if(auto e = runBuildScript(ctx, pkg)) return e;
    return installArtifact(ctx, pkg.name, full, prior);
}

std::optional<PackageError> installPackage(PackageContext& ctx, const PackageDescriptor& pkg,
                                           const std::optional<std::string>& prior){
    BuildInfo info;
    std::string err;
    if(!probe(ctx, pkg, info, err)) return PackageError{ErrorKind::Install, pkg.name, err};
    return installArtifact(ctx, pkg.name, fullPackageName(pkg, info, ctx.env.config.package_tag), prior);
}

std::optional<PackageError> applyAction(Action a, PackageContext& ctx, const PackageDescriptor& pkg,
                                        const std::optional<std::string>& prior){
    switch(a){
        case Action::Download: return downloadSources(ctx, pkg, prior);
        case Action::Build:    return buildPackage(ctx, pkg, prior);
        case Action::Install:  return installPackage(ctx, pkg, prior);
    }
    return std::nullopt;
}

} // namespace dlbuild
