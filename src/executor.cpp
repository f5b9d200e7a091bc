#include "executor.hpp"
#include "log.hpp"
#include "sink.hpp"

namespace dlbuild {

std::string fullPackageName(const PackageDescriptor& pkg, const BuildInfo& info, const std::string& tag){
    return pkg.name + "-" + pkg.version + "-" + info.arch + "-" + info.build + "_" + tag;
}

std::filesystem::path buildLogPath(const Config& c, const PackageDescriptor& pkg){
    return c.logging_directory / (pkg.name + "-" + pkg.version + ".log");
}

std::optional<PackageError> runBuildScript(PackageContext& ctx, const PackageDescriptor& pkg){
    FileSink log;
    std::string err;
    if(!log.open(buildLogPath(ctx.env.config, pkg), err))
        return PackageError{ErrorKind::Log, pkg.name, err};

    StreamSink console(ctx.console, true);
    TeeSink tee(console, log);

    Command cmd;
    cmd.argv = {"sh", "./" + pkg.name + ".SlackBuild"};
    cmd.env = {{"VERSION", pkg.version}};

    bool sink_ok = true;
    int rc = ctx.runner.run(cmd, tee, sink_ok);
    bool closed = log.close(err);

    if(rc != 0){
        std::string why = rc==127 ? "não foi possível executar " + cmd.argv[1] + " (status 127)"
                                  : cmd.argv[1] + " terminou com status " + std::to_string(rc);
        return PackageError{ErrorKind::Build, pkg.name, why + "; log em " + log.path().string()};
    }
    if(tee.secondFailed() || !closed)
        return PackageError{ErrorKind::Log, pkg.name, closed ? log.path().string() + ": erro ao gravar" : err};
    if(tee.firstFailed())
        return PackageError{ErrorKind::Log, pkg.name, "falha ao escrever a saída do build no console"};
    return std::nullopt;
}

std::optional<PackageError> installArtifact(PackageContext& ctx, const std::string& package,
                                            const std::string& full_name,
                                            const std::optional<std::string>& prior){
    const Config& c = ctx.env.config;
    std::string artifact = (c.cache_directory / (full_name + ".txz")).string();
    std::string target = prior ? *prior + "%" + artifact : artifact;

    logInfo("Instalando " + full_name);
    Command cmd;
    cmd.argv = {c.installer, "--reinstall", "--install-new", target};

    StreamSink console(ctx.console, true);
    bool sink_ok = true;
    int rc = ctx.runner.run(cmd, console, sink_ok);
    if(rc != 0)
        return PackageError{ErrorKind::Install, package, c.installer + " terminou com status "
                                                         + std::to_string(rc) + " para " + artifact};
    if(!sink_ok) logWarn("Saída do " + c.installer + " não pôde ser escrita no console");
    return std::nullopt;
}

} // namespace dlbuild
