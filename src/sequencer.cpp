#include "sequencer.hpp"
#include "log.hpp"
#include "util.hpp"

#include <vector>

namespace dlbuild {

WorkingDirectory::~WorkingDirectory(){
    if(!entered_) return;
    std::error_code ec;
    fs::current_path(previous_, ec);
    if(ec) logErr("Não foi possível voltar para " + previous_.string() + ": " + ec.message());
}

bool WorkingDirectory::enter(const fs::path& dir, std::string& err){
    std::error_code ec;
    fs::path here = fs::current_path(ec);
    if(!ec) fs::current_path(dir, ec);
    if(ec){
        err = dir.string() + ": " + ec.message();
        return false;
    }
    if(!entered_){
        previous_ = here;
        entered_ = true;
    }
    return true;
}

std::optional<PackageError> resolveDescriptor(const fs::path& repo, const std::string& name,
                                              PackageDescriptor& out){
    std::string err;
    if(!readInfoFile(repo / name / (name + ".info"), out, err))
        return PackageError{ErrorKind::Parse, name, err};
    return std::nullopt;
}

std::optional<PackageError> runStep(PackageContext& ctx, Action action, const fs::path& repo,
                                    const BuildStep& step){
    WorkingDirectory wd;
    std::string err;
    if(!wd.enter(repo / step.name, err)) return PackageError{ErrorKind::Parse, step.name, err};

    PackageDescriptor pkg;
    if(auto e = resolveDescriptor(repo, step.name, pkg)) return e;
    return applyAction(action, ctx, pkg, step.prior);
}

std::optional<PackageError> runCompileOrder(PackageContext& ctx, Action action,
                                            const fs::path& compile_order){
    std::vector<BuildStep> steps;
    std::string err;
    if(!readCompileOrder(compile_order, steps, err))
        return PackageError{ErrorKind::Parse, compile_order.string(), err};

    logInfo("Ordem de compilação " + compile_order.string() + " (" + std::to_string(steps.size())
            + " pacotes, " + actionName(action) + ")");

    // repo absoluto: cada passo troca o diretório atual
    fs::path repo = fs::absolute(compile_order).parent_path();
    for(const auto& step: steps){
        if(auto e = runStep(ctx, action, repo, step)) return e;
    }
    return std::nullopt;
}

std::optional<PackageError> runAll(PackageContext& ctx, Action action){
    const Config& c = ctx.env.config;
    ensureDir(c.logging_directory);
    if(action == Action::Build) ensureDir(c.temporary_directory);

    for(const auto& order: compileOrders(c)){
        if(auto e = runCompileOrder(ctx, action, order)) return e;
    }
    return std::nullopt;
}

} // namespace dlbuild
