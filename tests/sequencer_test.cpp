#include "sequencer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace dlbuild;
using namespace dlbuild::test;

namespace {

// Pacotes sem fontes: o build vai direto ao SlackBuild.
void addSimple(Workspace& ws, const std::string& name){
    ws.addPackage(name, "1.0", {}, {});
}

std::vector<std::string> builtNames(const FakeRunner& r){
    std::vector<std::string> v;
    for(const auto& c: r.builds()) v.push_back(c.cmd.argv[1]);
    return v;
}

} // namespace

TEST(Sequencer, RunsStepsInOrder){
    Workspace ws;
    for(auto n: {"a", "b", "c"}) addSimple(ws, n);
    auto order = ws.writeCompileOrder("compile-order", {"a", "b", "c"});

    fs::path before = fs::current_path();
    ASSERT_FALSE(runCompileOrder(ws.ctx, Action::Build, order));
    EXPECT_EQ(builtNames(ws.runner), (std::vector<std::string>{"./a.SlackBuild", "./b.SlackBuild", "./c.SlackBuild"}));
    EXPECT_TRUE(fs::current_path() == before);
}

TEST(Sequencer, StopsAtFirstFailure){
    Workspace ws;
    for(auto n: {"a", "b", "c"}) addSimple(ws, n);
    ws.runner.exit_codes["./b.SlackBuild"] = 1;
    auto order = ws.writeCompileOrder("compile-order", {"a", "b", "c"});

    fs::path before = fs::current_path();
    auto e = runCompileOrder(ws.ctx, Action::Build, order);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->kind, ErrorKind::Build);
    EXPECT_EQ(e->package, "b");
    EXPECT_EQ(builtNames(ws.runner), (std::vector<std::string>{"./a.SlackBuild", "./b.SlackBuild"}));
    EXPECT_EQ(ws.runner.installs("upgradepkg").size(), 1u);
    EXPECT_TRUE(fs::current_path() == before);
}

TEST(Sequencer, PriorNameReachesInstaller){
    Workspace ws;
    addSimple(ws, "novo");
    auto order = ws.writeCompileOrder("compile-order", {"antigo%novo"});
    ASSERT_FALSE(runCompileOrder(ws.ctx, Action::Install, order));
    auto installs = ws.runner.installs("upgradepkg");
    ASSERT_EQ(installs.size(), 1u);
    EXPECT_EQ(installs[0].cmd.argv.back(),
              "antigo%" + (ws.env.config.cache_directory / "novo-1.0-x86_64-2_dlack.txz").string());
    EXPECT_TRUE(fs::equivalent(installs[0].cwd, ws.repo() / "novo"));
}

TEST(Sequencer, MalformedCompileOrder){
    Workspace ws;
    addSimple(ws, "a");
    auto order = ws.writeCompileOrder("compile-order", {"a", "x%y%z"});
    auto e = runCompileOrder(ws.ctx, Action::Build, order);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->kind, ErrorKind::Parse);
    EXPECT_EQ(e->package, order.string());
    EXPECT_TRUE(ws.runner.calls.empty());
}

TEST(Sequencer, MissingDescriptor){
    Workspace ws;
    addSimple(ws, "a");
    fs::create_directories(ws.repo() / "fantasma");
    auto order = ws.writeCompileOrder("compile-order", {"a", "fantasma", "b"});

    auto e = runCompileOrder(ws.ctx, Action::Build, order);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->kind, ErrorKind::Parse);
    EXPECT_EQ(e->package, "fantasma");
    EXPECT_EQ(builtNames(ws.runner), (std::vector<std::string>{"./a.SlackBuild"}));
}

TEST(Sequencer, MissingPackageDirectory){
    Workspace ws;
    auto order = ws.writeCompileOrder("compile-order", {"sumido"});
    auto e = runCompileOrder(ws.ctx, Action::Download, order);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->kind, ErrorKind::Parse);
    EXPECT_EQ(e->package, "sumido");
}

TEST(Sequencer, RunAllStopsAfterFailingOrder){
    Workspace ws;
    for(auto n: {"a", "b", "c"}) addSimple(ws, n);
    ws.writeCompileOrder("primeira.order", {"a", "b"});
    ws.writeCompileOrder("segunda.order", {"c"});
    ws.env.config.repos = {"primeira.order", "segunda.order"};
    ws.runner.exit_codes["./b.SlackBuild"] = 7;

    auto e = runAll(ws.ctx, Action::Build);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->package, "b");
    EXPECT_EQ(builtNames(ws.runner), (std::vector<std::string>{"./a.SlackBuild", "./b.SlackBuild"}));
}

TEST(Sequencer, RunAllDownloadsEveryOrder){
    Workspace ws;
    const std::string url = "https://example.org/c-1.0.tar.gz";
    ws.transport.bodies[url] = "c";
    addSimple(ws, "a");
    ws.addPackage("c", "1.0", {url}, {"4a8a08f09d37b73795649038408b5f33"});
    ws.writeCompileOrder("primeira.order", {"a"});
    ws.writeCompileOrder("segunda.order", {"c"});
    ws.env.config.repos = {"primeira.order", "segunda.order"};

    auto e = runAll(ws.ctx, Action::Download);
    ASSERT_FALSE(e) << describe(*e);
    EXPECT_EQ(readText(ws.repo() / "c" / "c-1.0.tar.gz"), "c");
    EXPECT_TRUE(ws.runner.calls.empty());
}

TEST(Sequencer, ResolveDescriptor){
    Workspace ws;
    ws.addPackage("foo", "3.2", {"https://example.org/foo-3.2.tar.gz"}, {kEmptyMd5});
    PackageDescriptor pkg;
    ASSERT_FALSE(resolveDescriptor(ws.repo(), "foo", pkg));
    EXPECT_EQ(pkg.version, "3.2");
    ASSERT_EQ(pkg.downloads.size(), 1u);

    auto e = resolveDescriptor(ws.repo(), "nada", pkg);
    ASSERT_TRUE(e);
    EXPECT_EQ(e->kind, ErrorKind::Parse);
}

TEST(WorkingDirectory, RestoresOnScopeExit){
    TempDir tmp;
    fs::path before = fs::current_path();
    {
        WorkingDirectory wd; std::string err;
        ASSERT_TRUE(wd.enter(tmp.path(), err)) << err;
        EXPECT_TRUE(fs::equivalent(fs::current_path(), tmp.path()));
        EXPECT_FALSE(wd.enter(tmp.path() / "nao-existe", err));
        EXPECT_FALSE(err.empty());
    }
    EXPECT_TRUE(fs::current_path() == before);
}
