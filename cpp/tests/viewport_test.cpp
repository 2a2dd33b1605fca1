#include <gtest/gtest.h>
#include "railmap/viewport/viewport_controller.h"
#include <cmath>
#include <vector>

using namespace railmap;

TEST(ViewportTest, StartsAtIdentity) {
    ViewportController controller;
    EXPECT_DOUBLE_EQ(controller.zoom(), 1.0);
    EXPECT_EQ(controller.pan(), (Point2{0.0, 0.0}));
    EXPECT_EQ(controller.zoomPercent(), 100);
}

TEST(ViewportTest, ZoomAtKeepsAnchorFixed) {
    ViewportController controller;
    controller.zoomAt(Point2{100.0, 100.0}, 1.2);

    EXPECT_NEAR(controller.zoom(), 1.2, 1e-12);
    const Point2 anchor = controller.worldToScreen(Point2{100.0, 100.0});
    EXPECT_NEAR(anchor.x, 100.0, 1e-9);
    EXPECT_NEAR(anchor.y, 100.0, 1e-9);
}

TEST(ViewportTest, AnchorHoldsAcrossRepeatedZooms) {
    ViewportController controller;
    controller.panBy(Point2{-35.0, 72.5});

    const std::vector<Point2> anchors = {
        Point2{12.0, 640.0}, Point2{400.0, 300.0}, Point2{-80.0, 15.5}, Point2{799.0, 1.0}};
    const std::vector<double> factors = {1.1, 0.9, 1.25, 0.5, 2.0};

    for (const Point2& anchor : anchors) {
        for (double factor : factors) {
            const Point2 world = controller.screenToWorld(anchor);
            const double before = controller.zoom();
            controller.zoomAt(anchor, factor);
            const double expectedZoom = clampValue(before * factor, controller.zoomMin(), controller.zoomMax());
            EXPECT_NEAR(controller.zoom(), expectedZoom, 1e-12);

            const Point2 back = controller.worldToScreen(world);
            EXPECT_NEAR(back.x, anchor.x, 1e-6);
            EXPECT_NEAR(back.y, anchor.y, 1e-6);
        }
    }
}

TEST(ViewportTest, ZoomStaysInsideBounds) {
    ViewportController controller;
    for (int i = 0; i < 50; ++i) controller.zoomAt(Point2{10.0, 10.0}, 1.5);
    EXPECT_DOUBLE_EQ(controller.zoom(), 3.0);

    for (int i = 0; i < 50; ++i) controller.zoomAt(Point2{10.0, 10.0}, 0.5);
    EXPECT_DOUBLE_EQ(controller.zoom(), 0.3);
}

TEST(ViewportTest, ClampedZoomStillAnchors) {
    ViewportController controller;
    controller.zoomAt(Point2{0.0, 0.0}, 2.5);
    const Point2 anchor{250.0, 125.0};
    const Point2 world = controller.screenToWorld(anchor);

    controller.zoomAt(anchor, 4.0);
    EXPECT_DOUBLE_EQ(controller.zoom(), 3.0);
    const Point2 back = controller.worldToScreen(world);
    EXPECT_NEAR(back.x, anchor.x, 1e-9);
    EXPECT_NEAR(back.y, anchor.y, 1e-9);
}

TEST(ViewportTest, InvalidZoomFactorIsIgnored) {
    ViewportController controller;
    controller.panBy(Point2{5.0, 5.0});
    controller.zoomAt(Point2{1.0, 1.0}, 0.0);
    controller.zoomAt(Point2{1.0, 1.0}, -2.0);
    controller.zoomAt(Point2{1.0, 1.0}, std::nan(""));
    controller.zoomAt(Point2{1.0, 1.0}, INFINITY);

    EXPECT_DOUBLE_EQ(controller.zoom(), 1.0);
    EXPECT_EQ(controller.pan(), (Point2{5.0, 5.0}));
}

TEST(ViewportTest, PanAccumulatesAndIgnoresNonFinite) {
    ViewportController controller;
    controller.panBy(Point2{10.0, -4.0});
    controller.panBy(Point2{2.5, 1.0});
    controller.panBy(Point2{std::nan(""), 3.0});
    EXPECT_EQ(controller.pan(), (Point2{12.5, -3.0}));
}

TEST(ViewportTest, ScreenWorldConversionsAreInverse) {
    ViewportController controller;
    controller.zoomAt(Point2{300.0, 200.0}, 1.7);
    controller.panBy(Point2{-44.0, 19.0});

    const Point2 world{123.25, -87.5};
    const Point2 back = controller.screenToWorld(controller.worldToScreen(world));
    EXPECT_NEAR(back.x, world.x, 1e-9);
    EXPECT_NEAR(back.y, world.y, 1e-9);
}

TEST(ViewportTest, ResetRestoresIdentityAndStopsInertia) {
    ViewportController controller;
    controller.zoomAt(Point2{50.0, 50.0}, 2.0);
    controller.panBy(Point2{30.0, 30.0});
    ASSERT_TRUE(controller.beginInertia(Point2{1.0, 0.0}));

    controller.reset();
    EXPECT_DOUBLE_EQ(controller.zoom(), 1.0);
    EXPECT_EQ(controller.pan(), (Point2{0.0, 0.0}));
    EXPECT_FALSE(controller.isInertiaActive());
    EXPECT_FALSE(controller.stepInertia());
    EXPECT_EQ(controller.pan(), (Point2{0.0, 0.0}));
}

TEST(ViewportTest, ButtonZoomUsesViewportCentre) {
    ViewportController controller;
    controller.setViewportSize(800.0, 600.0);
    const Point2 centreWorld = controller.screenToWorld(Point2{400.0, 300.0});

    controller.zoomIn();
    EXPECT_NEAR(controller.zoom(), 1.2, 1e-12);
    EXPECT_EQ(controller.zoomPercent(), 120);
    Point2 centre = controller.worldToScreen(centreWorld);
    EXPECT_NEAR(centre.x, 400.0, 1e-9);
    EXPECT_NEAR(centre.y, 300.0, 1e-9);

    controller.zoomOut();
    controller.zoomOut();
    EXPECT_NEAR(controller.zoom(), 1.0 / 1.2, 1e-12);
    EXPECT_EQ(controller.zoomPercent(), 83);
    centre = controller.worldToScreen(centreWorld);
    EXPECT_NEAR(centre.x, 400.0, 1e-9);
    EXPECT_NEAR(centre.y, 300.0, 1e-9);
}

TEST(ViewportTest, ConfigureReclampsZoom) {
    ViewportController controller;
    controller.zoomAt(Point2{0.0, 0.0}, 2.5);

    ViewportConfig narrow;
    narrow.zoomMin = 0.5;
    narrow.zoomMax = 2.0;
    controller.configure(narrow, InertiaConfig{});
    EXPECT_DOUBLE_EQ(controller.zoom(), 2.0);
    EXPECT_DOUBLE_EQ(controller.zoomMax(), 2.0);
}

TEST(ViewportInertiaTest, DecaysUntilBelowEpsilon) {
    ViewportController controller;
    ASSERT_TRUE(controller.beginInertia(Point2{1.0, 0.0}));
    EXPECT_TRUE(controller.isInertiaActive());

    int frames = 0;
    while (controller.stepInertia(16.0)) {
        ++frames;
        ASSERT_LT(frames, 1000);
    }
    ++frames;

    // 0.95^89 is still above 0.01, 0.95^90 is not.
    EXPECT_EQ(frames, 90);
    EXPECT_FALSE(controller.isInertiaActive());
    EXPECT_EQ(controller.inertiaVelocity(), (Point2{0.0, 0.0}));

    const double expectedPan = 16.0 * (1.0 - std::pow(0.95, 90)) / (1.0 - 0.95);
    EXPECT_NEAR(controller.pan().x, expectedPan, 1e-6);
    EXPECT_DOUBLE_EQ(controller.pan().y, 0.0);
}

TEST(ViewportInertiaTest, FirstFrameMovesByVelocityTimesDuration) {
    ViewportController controller;
    ASSERT_TRUE(controller.beginInertia(Point2{0.5, -0.25}));
    EXPECT_TRUE(controller.stepInertia());
    EXPECT_NEAR(controller.pan().x, 8.0, 1e-12);
    EXPECT_NEAR(controller.pan().y, -4.0, 1e-12);
    EXPECT_NEAR(controller.inertiaVelocity().x, 0.475, 1e-12);
}

TEST(ViewportInertiaTest, SlowReleaseDoesNotStart) {
    ViewportController controller;
    EXPECT_FALSE(controller.beginInertia(Point2{0.005, 0.005}));
    EXPECT_FALSE(controller.isInertiaActive());
    EXPECT_FALSE(controller.stepInertia());
    EXPECT_EQ(controller.pan(), (Point2{0.0, 0.0}));
}

TEST(ViewportInertiaTest, CancelledLoopIgnoresLateSteps) {
    ViewportController controller;
    ASSERT_TRUE(controller.beginInertia(Point2{2.0, 2.0}));
    const std::uint32_t token = controller.inertiaToken();
    ASSERT_TRUE(controller.stepInertia(token, 16.0));
    const Point2 panAfterFirst = controller.pan();

    controller.cancelInertia();
    EXPECT_FALSE(controller.stepInertia(token, 16.0));
    EXPECT_EQ(controller.pan(), panAfterFirst);
}

TEST(ViewportInertiaTest, StaleTokenFromPreviousLoopIsIgnored) {
    ViewportController controller;
    ASSERT_TRUE(controller.beginInertia(Point2{2.0, 0.0}));
    const std::uint32_t oldToken = controller.inertiaToken();
    ASSERT_TRUE(controller.beginInertia(Point2{0.0, 1.0}));
    const std::uint32_t newToken = controller.inertiaToken();
    ASSERT_NE(oldToken, newToken);

    EXPECT_FALSE(controller.stepInertia(oldToken, 16.0));
    EXPECT_EQ(controller.pan(), (Point2{0.0, 0.0}));

    EXPECT_TRUE(controller.stepInertia(newToken, 16.0));
    EXPECT_NEAR(controller.pan().x, 0.0, 1e-12);
    EXPECT_NEAR(controller.pan().y, 16.0, 1e-12);
}
