/**
 * @file test_plan_generator.cpp
 * @brief Unit tests for PlanGenerator topologies.
 */

#include "workload/plan_generator.hpp"

#include "analysis/dependency_graph.hpp"

#include <gtest/gtest.h>
#include <random>
#include <unordered_map>

using namespace plan_scope;

// ─── Linear Chain ────────────────────────────

TEST(PlanGeneratorTest, LinearChainShape) {
    auto plan = PlanGenerator::linear_chain(4, 25);
    ASSERT_EQ(plan.size(), 4u);
    EXPECT_TRUE(plan[0].dependencies.empty());
    for (size_t i = 1; i < plan.size(); ++i) {
        ASSERT_EQ(plan[i].dependencies.size(), 1u);
        EXPECT_EQ(plan[i].dependencies[0], "chain_" + std::to_string(i - 1));
        EXPECT_EQ(plan[i].estimated_minutes, 25u);
    }

    auto graph = build_dependency_graph(plan);
    EXPECT_EQ(graph.max_depth, 3);
    EXPECT_EQ(graph.critical_path.size(), 4u);
}

TEST(PlanGeneratorTest, LinearChainEmpty) {
    EXPECT_TRUE(PlanGenerator::linear_chain(0, 10).empty());
}

// ─── Fan-out / Fan-in ────────────────────────

TEST(PlanGeneratorTest, FanOutFanIn) {
    auto plan = PlanGenerator::fan_out_fan_in(4, 20);
    ASSERT_EQ(plan.size(), 6u);
    EXPECT_EQ(plan.front().id, "fan_src");
    EXPECT_EQ(plan.back().id, "fan_sink");
    EXPECT_EQ(plan.back().dependencies.size(), 4u);

    auto graph = build_dependency_graph(plan);
    EXPECT_EQ(graph.max_depth, 2);
    EXPECT_EQ(graph.find_node("fan_src")->out_degree, 4u);
    ASSERT_EQ(graph.parallel_groups.size(), 1u);
    EXPECT_EQ(graph.parallel_groups[0].size(), 4u);
}

// ─── Diamond ─────────────────────────────────

TEST(PlanGeneratorTest, DiamondLevels) {
    auto plan = PlanGenerator::diamond(2, 3, 30);
    EXPECT_EQ(plan.size(), 10u);

    auto graph = build_dependency_graph(plan);
    EXPECT_FALSE(graph.has_cycles);
    EXPECT_EQ(graph.find_node("hub_1")->depth, 3);
    EXPECT_EQ(graph.find_node("merge_1")->depth, 5);
    EXPECT_EQ(graph.max_depth, 5);
    EXPECT_EQ(graph.parallel_groups.size(), 2u);
}

// ─── Random ──────────────────────────────────

TEST(PlanGeneratorTest, RandomPlanIsAcyclic) {
    std::mt19937 rng(42);
    for (int round = 0; round < 20; ++round) {
        auto plan = PlanGenerator::random_plan(30, 0.2f, 5, 120, rng);
        ASSERT_EQ(plan.size(), 30u);
        EXPECT_FALSE(build_dependency_graph(plan).has_cycles);
    }
}

TEST(PlanGeneratorTest, RandomPlanEstimatesInRange) {
    std::mt19937 rng(7);
    auto plan = PlanGenerator::random_plan(50, 0.1f, 15, 45, rng);
    for (const auto& t : plan) {
        ASSERT_TRUE(t.estimated_minutes.has_value());
        EXPECT_GE(*t.estimated_minutes, 15u);
        EXPECT_LE(*t.estimated_minutes, 45u);
    }
}

TEST(PlanGeneratorTest, RandomPlanDeterministicForSeed) {
    std::mt19937 a(123);
    std::mt19937 b(123);
    EXPECT_EQ(PlanGenerator::random_plan(20, 0.3f, 10, 60, a),
              PlanGenerator::random_plan(20, 0.3f, 10, 60, b));
}

TEST(PlanGeneratorTest, ZeroEdgeProbability) {
    std::mt19937 rng(1);
    auto plan = PlanGenerator::random_plan(10, 0.0f, 10, 10, rng);
    for (const auto& t : plan) EXPECT_TRUE(t.dependencies.empty());
}

// ─── Cycles ──────────────────────────────────

TEST(PlanGeneratorTest, WithCycleClosesLoop) {
    auto plan = PlanGenerator::with_cycle(PlanGenerator::linear_chain(3, 10), "chain_2", "chain_0");

    auto graph = build_dependency_graph(plan);
    EXPECT_TRUE(graph.has_cycles);
    EXPECT_EQ(graph.cycle_nodes.size(), 3u);
}

TEST(PlanGeneratorTest, WithCycleUnknownIdIsNoop) {
    auto original = PlanGenerator::linear_chain(3, 10);
    EXPECT_EQ(PlanGenerator::with_cycle(original, "nope", "chain_0"), original);
    EXPECT_EQ(PlanGenerator::with_cycle(original, "chain_0", "nope"), original);
}
