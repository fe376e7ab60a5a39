#include "common/TestUtils.h"
#include "mocks/FakeRunner.h"
#include "mocks/RecordingRunSink.h"
#include "runtime/TestExplorer.h"
#include <gtest/gtest.h>
#include <memory>

using namespace TEB;
using TEB::Test::FakeRunner;

namespace {

const char *LIST_FILES =
    R"(printf '{"projects":[{"name":"chromium","testDir":"%s/tests","files":["%s/tests/a.spec.ts"]}]}' "$PWD" "$PWD")";

// The runner reports whatever begin.json currently holds
const char *LIST_TESTS = "report \"$(cat \"$PWD/begin.json\")\"\nreport '{\"method\":\"onEnd\",\"params\":{}}'";

}  // namespace

class TestExplorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        specFile = dir.file("tests/a.spec.ts");
        writeTests({{"works", 3}});
        const TestConfig config = FakeRunner(dir).onListFiles(LIST_FILES).onTest(LIST_TESTS).install();

        BridgeSettings settings;
        settings.interpreter = "/bin/sh";
        settings.runnerCli = config.cli;
        settings.reporterModule = "/ext/reporter.js";
        settings.debounce = std::chrono::milliseconds(TEB::Test::Utils::getBaseDelay(20));
        settings.isUnderTest = true;
        explorer = std::make_unique<TestExplorer>(loop, settings, [](const RunRequest &) {
            return std::make_unique<TEB::Test::RecordingRunSink>();
        });
        explorer->onTreeChanged([this](const ReconcileResult &) { ++treeChanges; });
    }

    void writeTests(const std::vector<std::pair<std::string, int>> &tests) {
        std::string children;
        for (const auto &[title, line] : tests) {
            if (!children.empty()) {
                children += ",";
            }
            children += R"({"type":"test","title":")" + title + R"(","location":{"file":")" + specFile +
                        R"(","line":)" + std::to_string(line) + R"(,"column":5}})";
        }
        dir.write("begin.json", R"({"method":"onBegin","params":{"projects":[{"type":"project","title":"chromium","children":[{"type":"file","title":"a.spec.ts","location":{"file":")" +
                                    specFile + R"(","line":0,"column":0},"children":[)" + children + "]}]}]}}");
    }

    void load() {
        bool loaded = false;
        EXPECT_TRUE(explorer->rebuild({dir.path()}, [&loaded]() { loaded = true; }).empty());
        ASSERT_TRUE(waitFor([&loaded]() { return loaded; }));
    }

    bool waitFor(const std::function<bool()> &predicate) {
        return TEB::Test::Utils::waitFor(loop, predicate, TEB::Test::Utils::PROCESS_WAIT_MS);
    }

    EventLoop loop;
    TEB::Test::Utils::TempDir dir;
    std::string specFile;
    std::unique_ptr<TestExplorer> explorer;
    int treeChanges = 0;
};

TEST_F(TestExplorerTest, RebuildDiscoversConfigAndFiles) {
    load();

    ASSERT_EQ(explorer->models().size(), 1u);
    const TestModel &model = *explorer->models()[0];
    EXPECT_EQ(model.config().configFile, dir.file("playwright.config.ts"));
    EXPECT_EQ(model.config().version, (RunnerVersion{1, 40}));
    ASSERT_NE(model.project("chromium"), nullptr);
    EXPECT_TRUE(model.project("chromium")->isEnabled);

    const TreeNode *file = explorer->tree().getForLocation(specFile);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->kind(), TreeNodeKind::File);
    EXPECT_TRUE(file->canResolveChildren());
    EXPECT_GE(treeChanges, 1);
}

TEST_F(TestExplorerTest, ResolvingFileListsItsTests) {
    load();
    const TreeNode *file = explorer->tree().getForLocation(specFile);
    ASSERT_NE(file, nullptr);

    EXPECT_TRUE(explorer->resolveChildren(file->id()));
    ASSERT_TRUE(waitFor([this]() { return explorer->tree().getForLocation(specFile + ":3") != nullptr; }));

    const TreeNode *works = explorer->tree().getForLocation(specFile + ":3");
    ASSERT_NE(works, nullptr);
    EXPECT_EQ(works->label(), "works");
    EXPECT_FALSE(explorer->resolveChildren("missing"));
}

TEST_F(TestExplorerTest, ChangedTestFileIsListedAgain) {
    load();
    explorer->listTests({specFile});
    ASSERT_TRUE(waitFor([this]() { return explorer->tree().getForLocation(specFile + ":3") != nullptr; }));
    const TreeNode *listed = explorer->tree().getForLocation(specFile + ":3");
    ASSERT_NE(listed, nullptr);
    const std::string worksId = listed->id();

    writeTests({{"works", 3}, {"is new", 9}});
    explorer->observer().fileChanged(specFile);
    ASSERT_TRUE(waitFor([this]() { return explorer->tree().getForLocation(specFile + ":9") != nullptr; }));

    const TreeNode *relisted = explorer->tree().getForLocation(specFile + ":3");
    ASSERT_NE(relisted, nullptr);
    EXPECT_EQ(relisted->id(), worksId);
}

TEST_F(TestExplorerTest, DisablingProjectHidesItsFiles) {
    load();
    const std::string configFile = dir.file("playwright.config.ts");

    EXPECT_TRUE(explorer->setProjectEnabled(configFile, "chromium", false));
    EXPECT_EQ(explorer->tree().getForLocation(specFile), nullptr);
    EXPECT_FALSE(explorer->setProjectEnabled(configFile, "webkit", true));
    EXPECT_FALSE(explorer->setProjectEnabled(dir.file("other.config.ts"), "chromium", true));
}

TEST_F(TestExplorerTest, RebuildStartsNewGeneration) {
    load();
    const TreeNode *first = explorer->tree().getForLocation(specFile);
    ASSERT_NE(first, nullptr);
    const std::string firstId = first->id();

    load();

    const TreeNode *second = explorer->tree().getForLocation(specFile);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second->id(), firstId);
    EXPECT_EQ(explorer->models().size(), 1u);
}

TEST_F(TestExplorerTest, EmptyWorkspaceStillLoads) {
    TEB::Test::Utils::TempDir empty;
    bool loaded = false;

    explorer->rebuild({empty.path()}, [&loaded]() { loaded = true; });
    ASSERT_TRUE(waitFor([&loaded]() { return loaded; }));

    EXPECT_TRUE(explorer->models().empty());
    EXPECT_TRUE(explorer->tree().root().children().empty() ||
                explorer->tree().root().children()[0]->children().empty());
}

TEST_F(TestExplorerTest, WatchRequiresKnownProject) {
    load();
    CancellationTokenSource source;
    const std::string configFile = dir.file("playwright.config.ts");

    EXPECT_TRUE(explorer->watch(configFile, "chromium", std::nullopt, source.token()));
    EXPECT_FALSE(explorer->watch(configFile, "webkit", std::nullopt, source.token()));
    EXPECT_FALSE(explorer->watch(dir.file("other.config.ts"), "chromium", std::nullopt, source.token()));
}
