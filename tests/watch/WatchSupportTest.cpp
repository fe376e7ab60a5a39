#include "watch/WatchSupport.h"
#include "mocks/MockRelatedFilesResolver.h"
#include "tree/TreeReconciler.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace TEB;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

namespace {

const std::string LOGIN = "/ws/tests/login.spec.ts";
const std::string CHECKOUT = "/ws/tests/shop/checkout.spec.ts";

ReportEntry testEntry(const std::string &title, const std::string &file, int line) {
    ReportEntry entry;
    entry.kind = ReportEntryKind::Test;
    entry.title = title;
    entry.location = Location{file, line, 1};
    return entry;
}

ReportEntry fileEntry(const std::string &file, std::vector<ReportEntry> children) {
    ReportEntry entry;
    entry.kind = ReportEntryKind::File;
    entry.location = Location{file, 0, 0};
    entry.children = std::move(children);
    return entry;
}

}  // namespace

class WatchSupportTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = TestConfig{"/ws", "/ws/playwright.config.ts", "", {}};
        model = std::make_unique<TestModel>(config);
        model->applyListFiles(ListFilesReport::success({ProjectListFilesReport{"chromium", "/ws/tests", {LOGIN, CHECKOUT}}}));
        ReportEntry project;
        project.kind = ReportEntryKind::Project;
        project.title = "chromium";
        project.children = {fileEntry(LOGIN, {testEntry("signs in", LOGIN, 3)}),
                            fileEntry(CHECKOUT, {testEntry("pays", CHECKOUT, 5)})};
        model->applyListTests({project}, {LOGIN, CHECKOUT});

        tree.startNewGeneration({"/ws"});
        TreeReconciler reconciler(tree);
        reconciler.reconcile({model.get()});

        support = std::make_unique<WatchSupport>(
            tree, resolver, [this](const std::vector<TriggeredWatch> &watches) { triggered.push_back(watches); });
    }

    std::string idOf(const std::string &location) const {
        const TreeNode *node = tree.getForLocation(location);
        return node ? node->id() : std::string();
    }

    void answerWith(std::vector<std::string> testFiles) {
        ON_CALL(resolver, findRelatedTestFiles(_, _, _))
            .WillByDefault(Invoke([testFiles](const TestConfig &, const std::vector<std::string> &,
                                              IRelatedFilesResolver::Callback done) {
                done(RelatedFilesReport::success(testFiles));
            }));
    }

    static WorkspaceChange changed(const std::string &path) {
        WorkspaceChange change;
        change.changed.insert(path);
        return change;
    }

    TestConfig config;
    std::unique_ptr<TestModel> model;
    TestTree tree;
    NiceMock<TEB::Test::MockRelatedFilesResolver> resolver;
    std::unique_ptr<WatchSupport> support;
    std::vector<std::vector<TriggeredWatch>> triggered;
    CancellationTokenSource source;
};

TEST_F(WatchSupportTest, NarrowerWatchUnderWiderIsIgnored) {
    ASSERT_TRUE(support->addToWatch(config, "chromium", "/ws/tests", std::vector<std::string>{idOf("/ws/tests")},
                                    source.token()));

    EXPECT_FALSE(support->addToWatch(config, "chromium", "/ws/tests",
                                     std::vector<std::string>{idOf("/ws/tests/shop")}, source.token()));
    EXPECT_EQ(support->size(), 1u);
}

TEST_F(WatchSupportTest, WiderWatchReplacesNarrower) {
    support->addToWatch(config, "chromium", "/ws/tests", std::vector<std::string>{idOf("/ws/tests/shop")}, source.token());
    support->addToWatch(config, "chromium", "/ws/tests", std::vector<std::string>{idOf(LOGIN + ":3")}, source.token());
    ASSERT_EQ(support->size(), 2u);

    ASSERT_TRUE(support->addToWatch(config, "chromium", "/ws/tests", std::vector<std::string>{idOf("/ws/tests")},
                                    source.token()));

    ASSERT_EQ(support->size(), 1u);
    EXPECT_EQ(support->watches()[0].include, (std::vector<std::string>{idOf("/ws/tests")}));
}

TEST_F(WatchSupportTest, EqualScopeReplacesOlderWatch) {
    support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, source.token());
    const uint64_t first = support->watches()[0].id;

    EXPECT_TRUE(support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, source.token()));

    ASSERT_EQ(support->size(), 1u);
    EXPECT_NE(support->watches()[0].id, first);
}

TEST_F(WatchSupportTest, DifferentProjectsDoNotCollapse) {
    support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, source.token());
    support->addToWatch(config, "firefox", "/ws/tests", std::nullopt, source.token());

    EXPECT_EQ(support->size(), 2u);
}

TEST_F(WatchSupportTest, CancelledTokenRemovesWatch) {
    CancellationTokenSource watchSource;
    support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, watchSource.token());
    ASSERT_EQ(support->size(), 1u);

    watchSource.cancel();

    EXPECT_EQ(support->size(), 0u);
    EXPECT_FALSE(support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, watchSource.token()));
}

TEST_F(WatchSupportTest, ProjectWatchTriggersRelatedFiles) {
    support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, source.token());
    answerWith({CHECKOUT});
    EXPECT_CALL(resolver, findRelatedTestFiles(_, std::vector<std::string>{"/ws/src/cart.ts"}, _)).Times(1);

    support->workspaceChanged(changed("/ws/src/cart.ts"));

    ASSERT_EQ(triggered.size(), 1u);
    ASSERT_EQ(triggered[0].size(), 1u);
    EXPECT_EQ(triggered[0][0].include, (std::vector<std::string>{idOf(CHECKOUT)}));
}

TEST_F(WatchSupportTest, FolderWatchOnlyTriggersFilesBelowIt) {
    support->addToWatch(config, "chromium", "/ws/tests", std::vector<std::string>{idOf("/ws/tests/shop")},
                        source.token());
    answerWith({LOGIN});

    support->workspaceChanged(changed("/ws/src/auth.ts"));
    EXPECT_TRUE(triggered.empty());

    answerWith({LOGIN, CHECKOUT});
    support->workspaceChanged(changed("/ws/src/shared.ts"));
    ASSERT_EQ(triggered.size(), 1u);
    EXPECT_EQ(triggered[0][0].include, (std::vector<std::string>{idOf(CHECKOUT)}));
}

TEST_F(WatchSupportTest, TestWatchTriggersItself) {
    const std::string testId = idOf(LOGIN + ":3");
    support->addToWatch(config, "chromium", "/ws/tests", std::vector<std::string>{testId}, source.token());
    answerWith({LOGIN});

    support->workspaceChanged(changed(LOGIN));

    ASSERT_EQ(triggered.size(), 1u);
    EXPECT_EQ(triggered[0][0].include, (std::vector<std::string>{testId}));
}

TEST_F(WatchSupportTest, FailedQueryFallsBackToChangedFiles) {
    support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, source.token());
    ON_CALL(resolver, findRelatedTestFiles(_, _, _))
        .WillByDefault(Invoke([](const TestConfig &, const std::vector<std::string> &files,
                                 IRelatedFilesResolver::Callback done) {
            done(RelatedFilesReport::error("runner crashed", files));
        }));

    support->workspaceChanged(changed(LOGIN));

    ASSERT_EQ(triggered.size(), 1u);
    EXPECT_EQ(triggered[0][0].include, (std::vector<std::string>{idOf(LOGIN)}));
}

TEST_F(WatchSupportTest, NoWatchesNoQuery) {
    EXPECT_CALL(resolver, findRelatedTestFiles(_, _, _)).Times(0);
    support->workspaceChanged(changed(LOGIN));
    EXPECT_TRUE(triggered.empty());
}

TEST_F(WatchSupportTest, CreationsAloneDoNotQuery) {
    support->addToWatch(config, "chromium", "/ws/tests", std::nullopt, source.token());
    EXPECT_CALL(resolver, findRelatedTestFiles(_, _, _)).Times(0);

    WorkspaceChange change;
    change.created.insert("/ws/tests/new.spec.ts");
    support->workspaceChanged(change);
}
