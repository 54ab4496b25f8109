/**
 * @file test_task_loader.cpp
 * @brief Unit tests for loading plan snapshots from TOML.
 */

#include "io/task_loader.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace plan_scope;

TEST(TaskLoaderTest, ParsesFullTask) {
    auto result = parse_plan(R"(
        [plan]
        name = "Checkout"

        [[tasks]]
        id = "api"
        title = "Implement API"
        description = "Endpoints for checkout"
        status = "in_progress"
        priority = "P1"
        estimated_minutes = 90
        acceptance_criteria = "Contract tests pass"
        dependencies = ["design", "schema"]
    )");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->name, "Checkout");
    ASSERT_EQ(result->tasks.size(), 1u);
    const auto& task = result->tasks[0];
    EXPECT_EQ(task.id, "api");
    EXPECT_EQ(task.title, "Implement API");
    EXPECT_EQ(task.description, "Endpoints for checkout");
    EXPECT_EQ(task.status, TaskStatus::InProgress);
    EXPECT_EQ(task.priority, TaskPriority::P1);
    EXPECT_EQ(task.estimated_minutes, 90u);
    EXPECT_EQ(task.acceptance_criteria, "Contract tests pass");
    EXPECT_EQ(task.dependencies, (std::vector<TaskId>{"design", "schema"}));
}

TEST(TaskLoaderTest, DefaultsForOptionalFields) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "bare"
    )");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_TRUE(result->name.empty());
    const auto& task = result->tasks.at(0);
    EXPECT_EQ(task.status, TaskStatus::NotStarted);
    EXPECT_EQ(task.priority, TaskPriority::P2);
    EXPECT_FALSE(task.estimated_minutes.has_value());
    EXPECT_TRUE(task.title.empty());
    EXPECT_TRUE(task.dependencies.empty());
}

TEST(TaskLoaderTest, PreservesOrder) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "c"
        [[tasks]]
        id = "a"
        [[tasks]]
        id = "b"
    )");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->tasks.size(), 3u);
    EXPECT_EQ(result->tasks[0].id, "c");
    EXPECT_EQ(result->tasks[2].id, "b");
}

TEST(TaskLoaderTest, NoTasksIsEmptyPlan) {
    auto result = parse_plan(R"(
        [plan]
        name = "Empty"
    )");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->tasks.empty());
}

TEST(TaskLoaderTest, DanglingDependencyAccepted) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "a"
        dependencies = ["ghost"]
    )");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->tasks[0].dependencies.front(), "ghost");
}

// ─── Validation ──────────────────────────────

TEST(TaskLoaderTest, MissingId) {
    auto result = parse_plan(R"(
        [[tasks]]
        title = "Nameless"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(TaskLoaderTest, EmptyId) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = ""
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(TaskLoaderTest, DuplicateId) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "a"
        [[tasks]]
        id = "a"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DuplicateId);
}

TEST(TaskLoaderTest, UnknownPriority) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "a"
        priority = "urgent"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(TaskLoaderTest, UnknownStatus) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "a"
        status = "done"
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(TaskLoaderTest, NegativeEstimate) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "a"
        estimated_minutes = -5
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(TaskLoaderTest, NonStringDependency) {
    auto result = parse_plan(R"(
        [[tasks]]
        id = "a"
        dependencies = [1, 2]
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidInput);
}

TEST(TaskLoaderTest, MalformedToml) {
    auto result = parse_plan("[[tasks]\nid = ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

// ─── Files ───────────────────────────────────

TEST(TaskLoaderTest, MissingFile) {
    auto result = load_plan_file("/nonexistent/plan.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(TaskLoaderTest, LoadsFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "ps_test_plan.toml";
    {
        std::ofstream ofs(path);
        ofs << "[plan]\nname = \"Disk\"\n[[tasks]]\nid = \"x\"\nestimated_minutes = 15\n";
    }

    auto result = load_plan_file(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->name, "Disk");
    EXPECT_EQ(result->tasks.at(0).minutes_or(0), 15);
}

TEST(TaskLoaderTest, ShippedSamplePlanLoads) {
    auto path = std::filesystem::path{PLAN_SCOPE_SOURCE_DIR} / "config" / "plans" / "checkout_revamp.toml";
    auto result = load_plan_file(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->name, "Checkout revamp");
    EXPECT_EQ(result->tasks.size(), 5u);
}
