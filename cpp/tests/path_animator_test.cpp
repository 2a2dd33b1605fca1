#include <gtest/gtest.h>
#include "railmap/animation/path_animator.h"

using namespace railmap;
using protocol::EventType;

namespace {

class PathAnimatorTest : public ::testing::Test {
protected:
    EntityStore entities;
    PathRegistry registry;
    EventQueue events{64};
    PathAnimator animator{entities, registry, events};

    void SetUp() override {
        addWaypoint(1, Point2{0.0, 0.0});
        addWaypoint(2, Point2{100.0, 0.0});
        addWaypoint(3, Point2{100.0, 100.0});

        AnimatorConfig cfg;
        cfg.lateralSpacing = 0.0;
        animator.configure(cfg);
    }

    void addWaypoint(WaypointId id, const Point2& position) {
        Waypoint wp{};
        wp.id = id;
        wp.position = position;
        ASSERT_TRUE(registry.addWaypoint(wp));
    }

    EntityId addTrain(const Route& route, double speed, double delay = 0.0, double initialProgress = 0.0) {
        EntityRecord rec{};
        rec.id = entities.allocateId();
        rec.kind = EntityKind::Scheduled;
        rec.tangent = Point2{1.0, 0.0};
        rec.boundToPath = true;
        rec.draggable = true;
        rec.speed = speed;
        rec.delay = delay;
        rec.route = route;
        rec.initialProgress = initialProgress;
        entities.upsert(rec);
        return rec.id;
    }

    void setBaseRate(double rate) {
        AnimatorConfig cfg = animator.config();
        cfg.baseRate = rate;
        animator.configure(cfg);
    }
};

} // namespace

TEST_F(PathAnimatorTest, IncrementCombinesSpeedAndDelayFactors) {
    EntityRecord rec{};
    rec.speed = 100.0;
    EXPECT_NEAR(animator.incrementFor(rec), 0.015, 1e-15);

    rec.speed = 50.0;
    rec.delay = 5.0;
    EXPECT_NEAR(animator.incrementFor(rec), 0.5 * 0.7 * 0.015, 1e-15);

    rec.delay = 0.0;
    rec.speed = 0.0;
    EXPECT_DOUBLE_EQ(animator.incrementFor(rec), 0.0);

    rec.speed = -40.0;
    EXPECT_DOUBLE_EQ(animator.incrementFor(rec), 0.0);
}

TEST_F(PathAnimatorTest, TickAdvancesAlongCurrentLeg) {
    const EntityId id = addTrain({1, 2, 3}, 100.0);
    animator.start();

    ASSERT_TRUE(animator.tick());
    const PathProgress* prog = animator.progressOf(id);
    ASSERT_NE(prog, nullptr);
    EXPECT_NEAR(prog->progress, 0.015, 1e-12);
    EXPECT_EQ(prog->currentWaypoint, 1u);
    EXPECT_EQ(prog->nextWaypoint, 2u);

    const EntityRecord* rec = entities.get(id);
    EXPECT_NEAR(rec->position.x, 1.5, 1e-9);
    EXPECT_NEAR(rec->position.y, 0.0, 1e-12);
    EXPECT_EQ(rec->tangent, (Point2{100.0, 0.0}));
    EXPECT_EQ(animator.tickCount(), 1u);
}

TEST_F(PathAnimatorTest, RolloverResetsProgressAndMovesToNextLeg) {
    setBaseRate(0.05);
    const EntityId id = addTrain({1, 2, 3}, 100.0);
    animator.start();
    ASSERT_TRUE(animator.setProgress(id, 0.97));

    ASSERT_TRUE(animator.tick());
    const PathProgress* prog = animator.progressOf(id);
    ASSERT_NE(prog, nullptr);
    EXPECT_DOUBLE_EQ(prog->progress, 0.0);
    EXPECT_EQ(prog->currentWaypoint, 2u);
    EXPECT_EQ(prog->nextWaypoint, 3u);

    const EntityRecord* rec = entities.get(id);
    EXPECT_EQ(rec->position, (Point2{100.0, 0.0}));
    EXPECT_EQ(rec->tangent, (Point2{0.0, 100.0}));

    const auto drained = events.drain();
    ASSERT_EQ(drained.size(), 1u);
    EXPECT_EQ(drained[0].type, static_cast<std::uint16_t>(EventType::WaypointReached));
    EXPECT_EQ(drained[0].entityId, id);
    EXPECT_EQ(drained[0].waypointId, 2u);
    EXPECT_DOUBLE_EQ(drained[0].x, 100.0);
}

TEST_F(PathAnimatorTest, LastLegWrapsToRouteStart) {
    setBaseRate(0.5);
    const EntityId id = addTrain({1, 2, 3}, 100.0);
    animator.start();

    for (int i = 0; i < 4; ++i) ASSERT_TRUE(animator.tick());
    const PathProgress* prog = animator.progressOf(id);
    ASSERT_NE(prog, nullptr);
    EXPECT_EQ(prog->currentWaypoint, 3u);
    EXPECT_EQ(prog->nextWaypoint, 1u);

    ASSERT_TRUE(animator.tick());
    const EntityRecord* rec = entities.get(id);
    EXPECT_NEAR(rec->position.x, 50.0, 1e-9);
    EXPECT_NEAR(rec->position.y, 50.0, 1e-9);

    ASSERT_TRUE(animator.tick());
    EXPECT_EQ(prog->currentWaypoint, 1u);
    EXPECT_EQ(prog->nextWaypoint, 2u);
}

TEST_F(PathAnimatorTest, UnresolvedLegHoldsAtCurrentWaypoint) {
    const EntityId id = addTrain({2, 99}, 100.0);
    entities.get(id)->position = Point2{40.0, 40.0};
    animator.start();

    ASSERT_TRUE(animator.tick());
    const PathProgress* prog = animator.progressOf(id);
    ASSERT_NE(prog, nullptr);
    EXPECT_DOUBLE_EQ(prog->progress, 0.0);
    EXPECT_EQ(prog->currentWaypoint, 2u);
    EXPECT_EQ(entities.get(id)->position, (Point2{100.0, 0.0}));
    EXPECT_EQ(animator.lastUnresolvedCount(), 1u);
}

TEST_F(PathAnimatorTest, SingleWaypointRouteParks) {
    const EntityId id = addTrain({3}, 100.0);
    animator.start();

    ASSERT_TRUE(animator.tick());
    ASSERT_TRUE(animator.tick());
    EXPECT_EQ(entities.get(id)->position, (Point2{100.0, 100.0}));
    EXPECT_DOUBLE_EQ(animator.progressOf(id)->progress, 0.0);
    EXPECT_TRUE(events.drain().empty());
}

TEST_F(PathAnimatorTest, DraggedEntityKeepsDragPositionButStillAdvances) {
    const EntityId id = addTrain({1, 2}, 100.0);
    animator.start();
    entities.get(id)->position = Point2{33.0, -7.0};

    ASSERT_TRUE(animator.tick(id));
    EXPECT_EQ(entities.get(id)->position, (Point2{33.0, -7.0}));
    EXPECT_NEAR(animator.progressOf(id)->progress, 0.015, 1e-12);

    ASSERT_TRUE(animator.tick(kInvalidEntityId));
    EXPECT_NEAR(entities.get(id)->position.x, 3.0, 1e-9);
    EXPECT_NEAR(entities.get(id)->position.y, 0.0, 1e-12);
}

TEST_F(PathAnimatorTest, StoppedLoopDoesNothing) {
    const EntityId id = addTrain({1, 2}, 100.0);

    EXPECT_FALSE(animator.tick());
    EXPECT_EQ(animator.progressOf(id), nullptr);
    EXPECT_EQ(animator.tickCount(), 0u);

    const std::uint32_t oldToken = animator.start();
    animator.stop();
    EXPECT_FALSE(animator.isRunning());
    EXPECT_FALSE(animator.tick());

    const std::uint32_t newToken = animator.start();
    EXPECT_FALSE(animator.tick(oldToken, kInvalidEntityId));
    EXPECT_TRUE(animator.tick(newToken, kInvalidEntityId));
    EXPECT_EQ(animator.tickCount(), 1u);
}

TEST_F(PathAnimatorTest, ManualAndUnboundEntitiesAreNotTracked) {
    EntityRecord manual{};
    manual.id = entities.allocateId();
    manual.kind = EntityKind::Manual;
    manual.position = Point2{7.0, 7.0};
    manual.speed = 100.0;
    manual.route = {1, 2};
    entities.upsert(manual);

    const EntityId parked = addTrain({1, 2}, 100.0);
    entities.get(parked)->boundToPath = false;
    entities.get(parked)->position = Point2{12.0, 0.0};

    animator.start();
    ASSERT_TRUE(animator.tick());
    EXPECT_EQ(animator.trackedCount(), 0u);
    EXPECT_EQ(entities.get(manual.id)->position, (Point2{7.0, 7.0}));
    EXPECT_EQ(entities.get(parked)->position, (Point2{12.0, 0.0}));
    EXPECT_EQ(animator.ensureProgress(manual.id), nullptr);
}

TEST_F(PathAnimatorTest, InitialProgressSeedsOnlyValidValues) {
    const EntityId seeded = addTrain({1, 2}, 0.0, 0.0, 0.4);
    const EntityId outOfRange = addTrain({1, 2}, 0.0, 0.0, 1.5);

    ASSERT_NE(animator.ensureProgress(seeded), nullptr);
    ASSERT_NE(animator.ensureProgress(outOfRange), nullptr);
    EXPECT_DOUBLE_EQ(animator.progressOf(seeded)->progress, 0.4);
    EXPECT_DOUBLE_EQ(animator.progressOf(outOfRange)->progress, 0.0);

    EXPECT_TRUE(animator.setProgress(seeded, -0.2));
    EXPECT_DOUBLE_EQ(animator.progressOf(seeded)->progress, 0.0);
    EXPECT_FALSE(animator.setProgress(999, 0.5));
}

TEST_F(PathAnimatorTest, LineTraversedAgainstItsOrderIsReversed) {
    RailLine line{};
    line.id = "arc";
    line.waypoints = {1, 2};
    line.points = {Point2{0.0, 0.0}, Point2{50.0, 20.0}, Point2{100.0, 0.0}};
    ASSERT_TRUE(registry.addLine(line));

    const EntityId id = addTrain({2, 1}, 0.0, 0.0, 0.25);
    animator.start();
    ASSERT_TRUE(animator.tick());

    const EntityRecord* rec = entities.get(id);
    EXPECT_NEAR(rec->position.x, 75.0, 1e-9);
    EXPECT_NEAR(rec->position.y, 10.0, 1e-9);
    EXPECT_EQ(rec->tangent, (Point2{-50.0, 20.0}));
}

TEST_F(PathAnimatorTest, LegsOnSharedLineFollowOnlyTheirStretch) {
    RailLine line{};
    line.id = "through";
    line.waypoints = {1, 2, 3};
    line.points = {Point2{0.0, 0.0}, Point2{100.0, 0.0}, Point2{100.0, 100.0}};
    ASSERT_TRUE(registry.addLine(line));

    setBaseRate(0.5);
    const EntityId id = addTrain({1, 2, 3}, 100.0);
    animator.start();

    ASSERT_TRUE(animator.tick());
    const EntityRecord* rec = entities.get(id);
    EXPECT_NEAR(rec->position.x, 50.0, 1e-9);
    EXPECT_NEAR(rec->position.y, 0.0, 1e-9);

    ASSERT_TRUE(animator.tick());
    const PathProgress* prog = animator.progressOf(id);
    ASSERT_NE(prog, nullptr);
    EXPECT_EQ(prog->currentWaypoint, 2u);
    EXPECT_EQ(rec->position, (Point2{100.0, 0.0}));
    EXPECT_EQ(rec->tangent, (Point2{0.0, 100.0}));

    ASSERT_TRUE(animator.tick());
    EXPECT_NEAR(rec->position.x, 100.0, 1e-9);
    EXPECT_NEAR(rec->position.y, 50.0, 1e-9);
}

TEST_F(PathAnimatorTest, LaneOffsetIsStablePerEntityAndLeavesProgressAlone) {
    AnimatorConfig cfg = animator.config();
    cfg.lateralSpacing = 6.0;
    cfg.laneCount = 3;
    animator.configure(cfg);

    const EntityId a = addTrain({1, 2}, 100.0);
    const EntityId b = addTrain({1, 2}, 100.0);
    const EntityId c = addTrain({1, 2}, 100.0);
    const EntityId d = addTrain({1, 2}, 100.0);
    animator.start();
    ASSERT_TRUE(animator.tick());
    ASSERT_TRUE(animator.tick());

    // Tangent (100, 0) has left normal (0, 1).
    EXPECT_NEAR(entities.get(a)->laneOffset.y, -6.0, 1e-12);
    EXPECT_NEAR(entities.get(b)->laneOffset.y, 0.0, 1e-12);
    EXPECT_NEAR(entities.get(c)->laneOffset.y, 6.0, 1e-12);
    EXPECT_NEAR(entities.get(d)->laneOffset.y, -6.0, 1e-12);
    EXPECT_NEAR(entities.get(a)->laneOffset.x, 0.0, 1e-12);

    for (const EntityId id : {a, b, c, d}) {
        EXPECT_NEAR(animator.progressOf(id)->progress, 0.03, 1e-12);
        EXPECT_NEAR(entities.get(id)->position.x, 3.0, 1e-9);
        EXPECT_NEAR(entities.get(id)->position.y, 0.0, 1e-12);
    }
}
