/**
 * @file test_plan_health.cpp
 * @brief Unit tests for the plan health factors and grading.
 */

#include "analysis/plan_health.hpp"

#include <gtest/gtest.h>

using namespace plan_scope;

// ─── Helpers ─────────────────────────────────

static PlanTask make_task(const std::string& id, uint32_t minutes = 30,
                          TaskPriority priority = TaskPriority::P2,
                          std::vector<TaskId> deps = {}) {
    return PlanTask{
        .id = id,
        .title = "Task " + id,
        .description = "This description is long enough to count as detailed, over fifty chars.",
        .status = TaskStatus::NotStarted,
        .priority = priority,
        .estimated_minutes = minutes,
        .acceptance_criteria = "Criteria",
        .dependencies = std::move(deps)
    };
}

/// Ten tasks split 3/4/3 across P1/P2/P3.
static std::vector<PlanTask> balanced_plan() {
    std::vector<PlanTask> tasks;
    for (int i = 0; i < 10; ++i) {
        auto priority = i < 3 ? TaskPriority::P1 : (i < 7 ? TaskPriority::P2 : TaskPriority::P3);
        tasks.push_back(make_task("t" + std::to_string(i), 30, priority));
    }
    return tasks;
}

static int factor_score(const PlanHealth& health, std::string_view name) {
    const auto* factor = health.find_factor(name);
    EXPECT_NE(factor, nullptr) << name;
    return factor ? factor->score : -1;
}

// ─── Grades ──────────────────────────────────

TEST(PlanHealthTest, GradeThresholds) {
    EXPECT_EQ(grade_for(100), Grade::A);
    EXPECT_EQ(grade_for(90), Grade::A);
    EXPECT_EQ(grade_for(89), Grade::B);
    EXPECT_EQ(grade_for(80), Grade::B);
    EXPECT_EQ(grade_for(70), Grade::C);
    EXPECT_EQ(grade_for(60), Grade::D);
    EXPECT_EQ(grade_for(59), Grade::F);
    EXPECT_EQ(grade_for(0), Grade::F);
}

TEST(PlanHealthTest, EmptyInput) {
    auto health = calculate_plan_health({});
    EXPECT_EQ(health.score, 0);
    EXPECT_EQ(health.grade, Grade::F);
    ASSERT_EQ(health.factors.size(), 1u);
    EXPECT_EQ(health.factors[0].name, "No tasks");
}

TEST(PlanHealthTest, PerfectPlan) {
    auto tasks = balanced_plan();
    auto health = calculate_plan_health(tasks);

    ASSERT_EQ(health.factors.size(), 6u);
    for (const auto& f : health.factors) {
        EXPECT_EQ(f.score, 100) << f.name;
    }
    EXPECT_EQ(health.score, 100);
    EXPECT_EQ(health.grade, Grade::A);
}

TEST(PlanHealthTest, FactorWeights) {
    auto tasks = balanced_plan();
    auto health = calculate_plan_health(tasks);

    int total = 0;
    for (const auto& f : health.factors) total += f.weight;
    EXPECT_EQ(total, 100);
    EXPECT_EQ(health.find_factor("Task Granularity")->weight, 25);
    EXPECT_EQ(health.find_factor("Acceptance Criteria Coverage")->weight, 20);
    EXPECT_EQ(health.find_factor("Priority Balance")->weight, 15);
    EXPECT_EQ(health.find_factor("Dependency Health")->weight, 20);
    EXPECT_EQ(health.find_factor("Description Quality")->weight, 10);
    EXPECT_EQ(health.find_factor("Decomposition Readiness")->weight, 10);
    EXPECT_EQ(health.find_factor("Unknown"), nullptr);
}

// ─── Individual Factors ──────────────────────

TEST(PlanHealthTest, GranularityPenalizesVeryLargeTasks) {
    std::vector<PlanTask> tasks{make_task("a", 30), make_task("b", 150)};
    auto health = calculate_plan_health(tasks);

    EXPECT_EQ(factor_score(health, "Task Granularity"), 40);
    EXPECT_EQ(health.find_factor("Task Granularity")->details,
              "1/2 in 15-45 min. 1 oversized. 1 exceed 2h.");
}

TEST(PlanHealthTest, DecompositionReadiness) {
    std::vector<PlanTask> tasks{make_task("a", 30), make_task("b", 150), make_task("c", 90)};
    auto health = calculate_plan_health(tasks);

    // 100 − 25×1 − 10×2
    EXPECT_EQ(factor_score(health, "Decomposition Readiness"), 55);
}

TEST(PlanHealthTest, SinglePriorityTierPenalized) {
    std::vector<PlanTask> tasks{make_task("a"), make_task("b")};
    auto health = calculate_plan_health(tasks);
    EXPECT_EQ(factor_score(health, "Priority Balance"), 0);
}

TEST(PlanHealthTest, DependencyHealthWithCycle) {
    std::vector<PlanTask> tasks{
        make_task("a", 30, TaskPriority::P2, {"b"}),
        make_task("b", 30, TaskPriority::P2, {"a"})
    };
    auto health = calculate_plan_health(tasks);
    EXPECT_EQ(factor_score(health, "Dependency Health"), 50);
    EXPECT_EQ(health.find_factor("Dependency Health")->details, "Depth:0. Cycles:YES. AvgIn:1.0.");
}

TEST(PlanHealthTest, DependencyHealthDepthPenalty) {
    std::vector<PlanTask> tasks;
    for (int i = 0; i < 5; ++i) {
        std::vector<TaskId> deps;
        if (i > 0) deps.push_back("t" + std::to_string(i - 1));
        tasks.push_back(make_task("t" + std::to_string(i), 30, TaskPriority::P2, deps));
    }
    auto health = calculate_plan_health(tasks);
    // Depth 4: −15
    EXPECT_EQ(factor_score(health, "Dependency Health"), 85);
}

TEST(PlanHealthTest, DescriptionQuality) {
    auto a = make_task("a");
    auto b = make_task("b");
    b.description.clear();
    std::vector<PlanTask> tasks{a, b};
    auto health = calculate_plan_health(tasks);

    // Lengths 71 and 0: the 35.5 average contributes 35.5, the 1/2
    // detailed share contributes 25.
    ASSERT_EQ(a.description.size(), 71u);
    EXPECT_EQ(factor_score(health, "Description Quality"), 61);
    EXPECT_EQ(health.find_factor("Description Quality")->details, "Avg:36 chars. 1/2>=50.");
}

TEST(PlanHealthTest, CriteriaCoverage) {
    auto a = make_task("a");
    auto b = make_task("b");
    auto c = make_task("c");
    c.acceptance_criteria = "  ";
    std::vector<PlanTask> tasks{a, b, c};
    auto health = calculate_plan_health(tasks);
    EXPECT_EQ(factor_score(health, "Acceptance Criteria Coverage"), 67);
}

// ─── Aggregate ───────────────────────────────

TEST(PlanHealthTest, WeightedMean) {
    auto task = make_task("solo");
    task.description.clear();
    task.acceptance_criteria.clear();
    std::vector<PlanTask> tasks{task};

    auto health = calculate_plan_health(tasks);
    // granularity 100×25 + dependency 100×20 + readiness 100×10, others 0.
    EXPECT_EQ(health.score, 55);
    EXPECT_EQ(health.grade, Grade::F);
}

TEST(PlanHealthTest, ScoresStayInRange) {
    std::vector<PlanTask> tasks;
    for (int i = 0; i < 8; ++i) {
        auto t = make_task("t" + std::to_string(i), 500, TaskPriority::P1, {"t" + std::to_string((i + 1) % 8)});
        t.description.clear();
        t.acceptance_criteria.clear();
        tasks.push_back(t);
    }

    auto health = calculate_plan_health(tasks);
    EXPECT_GE(health.score, 0);
    EXPECT_LE(health.score, 100);
    for (const auto& f : health.factors) {
        EXPECT_GE(f.score, 0) << f.name;
        EXPECT_LE(f.score, 100) << f.name;
    }
}
