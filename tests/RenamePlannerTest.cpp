#include "archname/batch/RenamePlanner.h"
#include "archname/Exceptions.h"
#include "archname/utils/FileUtils.h"
#include <gtest/gtest.h>
#include <chrono>

using namespace arn;

namespace fs = std::filesystem;

class RenamePlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() /
              ("archname_" + std::string(info->name()) + "_" + std::to_string(stamp));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void touch(const std::string& name, const std::string& content = "<html></html>") {
        FileUtils::writeTextFile(dir / name, content);
    }

    std::vector<RenameOperation> planAll() {
        RenamePlanner planner(engine);
        return planner.plan(RenamePlanner::scan(dir, {".html", ".htm"}));
    }

    fs::path dir;
    FilenameEngine engine;
};

TEST_F(RenamePlannerTest, ScanFiltersAndSorts) {
    touch("b.html");
    touch("A.HTML");
    touch("c.htm");
    touch("notes.txt");
    fs::create_directories(dir / "sub.html");

    auto files = RenamePlanner::scan(dir, {".html", ".htm"});
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename().string(), "A.HTML");
    EXPECT_EQ(files[1].filename().string(), "b.html");
    EXPECT_EQ(files[2].filename().string(), "c.htm");
}

TEST_F(RenamePlannerTest, ScanMissingDirectoryThrows) {
    EXPECT_THROW(RenamePlanner::scan(dir / "missing", {".html"}), FileNotFoundException);
}

TEST_F(RenamePlannerTest, PlanAndApply) {
    touch("(Hello World) [URL] https%3A%2F%2Fexample.com.html");
    touch("already_named.html");

    auto operations = planAll();
    ASSERT_EQ(operations.size(), 2u);

    EXPECT_EQ(operations[0].newName, "Hello_World.html");
    EXPECT_FALSE(operations[0].conflict);
    EXPECT_TRUE(operations[1].unchanged());
    EXPECT_EQ(RenamePlanner::countPending(operations), 1u);
    EXPECT_EQ(RenamePlanner::countConflicts(operations), 0u);

    // Planning touches nothing
    EXPECT_FALSE(fs::exists(dir / "Hello_World.html"));

    ApplySummary summary = RenamePlanner::apply(operations, false);
    EXPECT_EQ(summary.renamed, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.failed, 0u);
    ASSERT_EQ(summary.messages.size(), 1u);
    EXPECT_EQ(summary.messages[0],
              "Renamed: (Hello World) [URL] https%3A%2F%2Fexample.com.html -> Hello_World.html");

    EXPECT_TRUE(fs::exists(dir / "Hello_World.html"));
    EXPECT_TRUE(fs::exists(dir / "already_named.html"));
}

TEST_F(RenamePlannerTest, OtherFilesSeedRegistry) {
    touch("hello.txt", "notes");
    touch("(hello) [URL] y.html");

    auto operations = planAll();
    ASSERT_EQ(operations.size(), 1u);
    EXPECT_EQ(operations[0].newName, "hello_001.html");
}

TEST_F(RenamePlannerTest, ExistingTargetIsConflict) {
    touch("A B.html", "first");
    touch("A_B.html", "second");

    auto operations = planAll();
    ASSERT_EQ(operations.size(), 2u);
    EXPECT_EQ(operations[0].oldName, "A B.html");
    EXPECT_EQ(operations[0].newName, "A_B.html");
    EXPECT_TRUE(operations[0].conflict);
    EXPECT_EQ(operations[0].reason, "Target file already exists");
    EXPECT_EQ(RenamePlanner::countConflicts(operations), 1u);

    // Names issued within the plan stay unique
    EXPECT_EQ(operations[1].newName, "A_B_001.html");

    ApplySummary summary = RenamePlanner::apply(operations, false);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.renamed, 1u);
    EXPECT_EQ(summary.messages[0], "Skipping A B.html: Target file already exists");

    EXPECT_EQ(FileUtils::readTextFile(dir / "A B.html"), "first");
    EXPECT_EQ(FileUtils::readTextFile(dir / "A_B_001.html"), "second");
}

TEST_F(RenamePlannerTest, EmptyListPlansNothing) {
    RenamePlanner planner(engine);
    EXPECT_TRUE(planner.plan({}).empty());
}

TEST_F(RenamePlannerTest, LongerExtensionKeepsMinimumBudget) {
    NamingConfig config;
    config.targetBudget = config.minimumTotalBudget();
    FilenameEngine small(config);
    touch("some fairly long page title.markdown");

    RenamePlanner planner(small);
    std::vector<RenameOperation> operations;
    ASSERT_NO_THROW(operations = planner.plan(RenamePlanner::scan(dir, {".markdown"})));
    ASSERT_EQ(operations.size(), 1u);

    const std::string& name = operations[0].newName;
    ASSERT_GT(name.size(), 9u);
    EXPECT_EQ(name.substr(name.size() - 9), ".markdown");
    EXPECT_LE(name.size() - 9, NamingConfig::MIN_STEM_BYTES);
}
