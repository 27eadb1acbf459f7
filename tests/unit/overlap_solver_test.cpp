#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <string>
#include "astrofield/algo/sat.hpp"
#include "astrofield/core/debug.hpp"
#include "astrofield/core/profile.hpp"
#include "astrofield/entities/asteroid_factory.hpp"
#include "astrofield/systems/collision/collider_builder.hpp"
#include "astrofield/systems/collision/overlap_solver.hpp"

using namespace Systems;

class OverlapSolverTest : public ::testing::Test {
protected:
    entt::registry registry;
    OverlapSolver solver{OverlapConfig(), BoundaryConfig()};

    void SetUp() override {
        auto &state = Entities::fieldState(registry);
        state.width = 1600.0;
        state.height = 1000.0;
        state.label = Components::LabelLayout{18.0, 280.0, 44.0};
    }

    // Body with a regular 18-gon outline of the given radius
    entt::entity createBody(std::size_t index, double x, double y, double radius,
                            double dx = 0.0, double dy = 0.0) {
        Entities::SilhouetteConfig round;
        round.base = 1.0;
        round.ampA = 0.0;
        round.ampB = 0.0;

        ProjectSeed seed;
        seed.id = "body-" + std::to_string(index);
        seed.asteroid.size = radius * 2.0;
        return Entities::AsteroidFactory::createAsteroid(
            registry, seed, index, Components::Position(x, y), Components::Drift(dx, dy),
            0.0, 0.0, Entities::generateSilhouette(radius * 2.0, 0.0, round));
    }

    Polygon colliderOf(entt::entity e) {
        return Collision::mergedCollider(registry.get<Components::Silhouette>(e),
                                         registry.get<Components::Position>(e),
                                         registry.get<Components::Rotation>(e).degrees,
                                         registry.get<Components::CollisionRadius>(e).value,
                                         Entities::fieldState(registry).label);
    }

    void expectInBounds(entt::entity e) {
        const auto &pos = registry.get<Components::Position>(e);
        Bounds b = BoundarySystem::computeBounds(registry.get<Components::CollisionRadius>(e).value,
                                                 Entities::fieldState(registry), BoundaryConfig());
        EXPECT_GE(pos.x, b.minX);
        EXPECT_LE(pos.x, b.maxX);
        EXPECT_GE(pos.y, b.minY);
        EXPECT_LE(pos.y, b.maxY);
    }
};

TEST_F(OverlapSolverTest, NoBodiesIsNoOp) {
    solver.solve(registry, 2);
    solver.update(registry);
    SUCCEED();
}

TEST_F(OverlapSolverTest, TwoOverlappingBodiesSeparate) {
    auto a = createBody(0, 700.0, 300.0, 40.0);
    auto b = createBody(1, 720.0, 300.0, 40.0);
    ASSERT_TRUE(satCollide(colliderOf(a), colliderOf(b)).has_value());

    DebugStats::reset();
    uint64_t const timedBefore = Profiling::Profiler::callCount("OverlapSolver");
    for (int round = 0; round < 60; ++round) {
        solver.solve(registry, 2);
    }
    EXPECT_GE(DebugStats::contactCount(), 1);
    EXPECT_EQ(Profiling::Profiler::callCount("OverlapSolver"), timedBefore + 60);

    const auto &pa = registry.get<Components::Position>(a);
    const auto &pb = registry.get<Components::Position>(b);
    EXPECT_GE(pa.dist(pb), 80.0);
    EXPECT_FALSE(satCollide(colliderOf(a), colliderOf(b)).has_value());
    expectInBounds(a);
    expectInBounds(b);
}

TEST_F(OverlapSolverTest, PairTraceIsPrintedWithDebugOutput) {
#if ASTROFIELD_ENABLE_DEBUG
    createBody(0, 700.0, 300.0, 40.0);
    createBody(1, 720.0, 300.0, 40.0);

    testing::internal::CaptureStdout();
    solver.solve(registry, 1);
    std::string const out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("[OverlapSolver] pair 0/1"), std::string::npos);
#else
    GTEST_SKIP() << "built without ASTROFIELD_ENABLE_DEBUG";
#endif
}

TEST_F(OverlapSolverTest, ClosingBodiesExchangeDrift) {
    // Stacked vertically, so the label pushes them apart along y
    auto a = createBody(0, 700.0, 300.0, 40.0, 0.0, 1.0);
    auto b = createBody(1, 700.0, 400.0, 40.0, 0.0, -1.0);

    solver.solve(registry, 1);

    const auto &pa = registry.get<Components::Position>(a);
    const auto &pb = registry.get<Components::Position>(b);
    EXPECT_LT(pa.y, 300.0);
    EXPECT_GT(pb.y, 400.0);
    EXPECT_NEAR(pa.x, 700.0, 1e-9);

    // Near-elastic: drifts reverse and keep 97% of their speed
    EXPECT_NEAR(registry.get<Components::Drift>(a).y, -0.97, 1e-9);
    EXPECT_NEAR(registry.get<Components::Drift>(b).y, 0.97, 1e-9);
    EXPECT_FALSE(satCollide(colliderOf(a), colliderOf(b)).has_value());
}

TEST_F(OverlapSolverTest, SeparatingBodiesKeepTheirDrift) {
    auto a = createBody(0, 700.0, 300.0, 40.0, 0.0, -0.5);
    auto b = createBody(1, 700.0, 400.0, 40.0, 0.0, 0.5);

    solver.solve(registry, 1);

    EXPECT_DOUBLE_EQ(registry.get<Components::Drift>(a).y, -0.5);
    EXPECT_DOUBLE_EQ(registry.get<Components::Drift>(b).y, 0.5);
}

TEST_F(OverlapSolverTest, ResolvedConfigurationIsAFixedPoint) {
    auto a = createBody(0, 700.0, 300.0, 40.0);
    auto b = createBody(1, 720.0, 300.0, 40.0);
    auto c = createBody(2, 1100.0, 250.0, 50.0);
    for (int round = 0; round < 60; ++round) {
        solver.solve(registry, 2);
    }

    Components::Position before[] = {
        registry.get<Components::Position>(a),
        registry.get<Components::Position>(b),
        registry.get<Components::Position>(c)
    };

    solver.solve(registry, 1);

    entt::entity bodies[] = {a, b, c};
    for (int i = 0; i < 3; ++i) {
        const auto &after = registry.get<Components::Position>(bodies[i]);
        EXPECT_NEAR(after.x, before[i].x, 1e-9);
        EXPECT_NEAR(after.y, before[i].y, 1e-9);
    }
}

TEST_F(OverlapSolverTest, ResolveCountsCorrectedPairs) {
    auto a = createBody(0, 700.0, 300.0, 40.0);
    auto b = createBody(1, 720.0, 300.0, 40.0);

    std::vector<SolverBody> bodies;
    for (auto e : {a, b}) {
        SolverBody body;
        body.e = e;
        body.pos = registry.get<Components::Position>(e);
        body.drift = registry.get<Components::Drift>(e);
        body.rotation = 0.0;
        body.radius = 40.0;
        body.silhouette = &registry.get<Components::Silhouette>(e);
        bodies.push_back(body);
    }

    // First pass separates them, second pass finds nothing to do
    int corrected = OverlapSolver::resolve(bodies, Entities::fieldState(registry),
                                           OverlapConfig(), BoundaryConfig(), 2);
    EXPECT_EQ(corrected, 1);

    // Working copies only; the registry is untouched
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(a).y, 300.0);
}

TEST_F(OverlapSolverTest, UpdateUsesConfiguredPassCount) {
    OverlapConfig config;
    config.iterations = 0;
    OverlapSolver idle(config, BoundaryConfig());

    auto a = createBody(0, 700.0, 300.0, 40.0);
    createBody(1, 720.0, 300.0, 40.0);

    idle.update(registry);
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(a).y, 300.0);

    solver.update(registry);
    EXPECT_GT(std::abs(registry.get<Components::Position>(a).y - 300.0), 1.0);
}
