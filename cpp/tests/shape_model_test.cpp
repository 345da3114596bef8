#include <gtest/gtest.h>
#include "pixeloid/geometry/shape_authoring.h"
#include "pixeloid/geometry/shape_generators.h"
#include "pixeloid/geometry/shape_metrics.h"
#include "pixeloid/geometry/vertex_edit.h"
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using namespace pixeloid;

namespace {
    constexpr double kPi = 3.14159265358979323846;

    // Multiples of 0.25 keep every generator and edit computation exact.
    double dyadic(std::mt19937& rng, int lo, int hi) {
        std::uniform_int_distribution<int> d(lo * 4, hi * 4);
        return static_cast<double>(d(rng)) * 0.25;
    }

    std::vector<ShapeParameters> sampleParameters(std::mt19937& rng) {
        const WorldPoint c{dyadic(rng, -50, 50), dyadic(rng, -50, 50)};
        const double a = dyadic(rng, 1, 40);
        const double b = dyadic(rng, 1, 40);
        return {
            PointParams{c},
            LineParams{c, WorldPoint{c.x + a, c.y - b}},
            CircleParams{c, a},
            RectangleParams{c, a, b},
            DiamondParams{c, a, b},
        };
    }
}

TEST(ShapeGeneratorsTest, RectangleCornersAreTopLeftClockwise) {
    const auto v = generateVertices(RectangleParams{{5.0, 5.0}, 4.0, 2.0});
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[0], (WorldPoint{3.0, 4.0}));
    EXPECT_EQ(v[1], (WorldPoint{7.0, 4.0}));
    EXPECT_EQ(v[2], (WorldPoint{7.0, 6.0}));
    EXPECT_EQ(v[3], (WorldPoint{3.0, 6.0}));
    EXPECT_EQ(computeBounds(v), (AABB{3.0, 4.0, 7.0, 6.0}));
}

TEST(ShapeGeneratorsTest, DiamondCardinalOrderWestNorthEastSouth) {
    const auto v = generateVertices(DiamondParams{{0.0, 0.0}, 8.0, 4.0});
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[0], (WorldPoint{-4.0, 0.0}));
    EXPECT_EQ(v[1], (WorldPoint{0.0, -2.0}));
    EXPECT_EQ(v[2], (WorldPoint{4.0, 0.0}));
    EXPECT_EQ(v[3], (WorldPoint{0.0, 2.0}));
}

TEST(ShapeGeneratorsTest, CircleSamplesStartEastAndLieOnRadius) {
    const auto v = generateVertices(CircleParams{{1.0, -1.0}, 3.0}, 12);
    ASSERT_EQ(v.size(), 12u);
    EXPECT_EQ(v[0], (WorldPoint{4.0, -1.0}));
    for (const WorldPoint& p : v) {
        EXPECT_NEAR(std::hypot(p.x - 1.0, p.y + 1.0), 3.0, 1e-12);
    }
    EXPECT_EQ(vertexCount(CircleParams{{0.0, 0.0}, 1.0}, 12), 12u);
}

TEST(ShapeGeneratorsTest, EmptyVertexListHasZeroBounds) {
    EXPECT_EQ(computeBounds({}), (AABB{0.0, 0.0, 0.0, 0.0}));
}

TEST(ShapeGeneratorsTest, ValidateRejectsNonPositiveAndNonFinite) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(validateParameters(CircleParams{{0.0, 0.0}, 0.0}), ObjectError::InvalidParameters);
    EXPECT_EQ(validateParameters(RectangleParams{{0.0, 0.0}, -1.0, 2.0}), ObjectError::InvalidParameters);
    EXPECT_EQ(validateParameters(DiamondParams{{nan, 0.0}, 1.0, 2.0}), ObjectError::InvalidParameters);
    EXPECT_EQ(validateParameters(LineParams{{0.0, 0.0}, {0.0, 0.0}}), ObjectError::Ok);
    EXPECT_EQ(validateParameters(PointParams{{-3.5, 2.0}}), ObjectError::Ok);
}

TEST(ShapeGeneratorsTest, TranslateMovesPositionsOnly) {
    const ShapeParameters moved = translateParameters(RectangleParams{{1.0, 1.0}, 4.0, 2.0}, WorldPoint{0.5, -2.0});
    EXPECT_EQ(std::get<RectangleParams>(moved), (RectangleParams{{1.5, -1.0}, 4.0, 2.0}));
    const ShapeParameters line = translateParameters(LineParams{{0.0, 0.0}, {2.0, 2.0}}, WorldPoint{1.0, 1.0});
    EXPECT_EQ(std::get<LineParams>(line), (LineParams{{1.0, 1.0}, {3.0, 3.0}}));
}

TEST(VertexEditTest, EditingVertexOntoItselfReturnsSameParameters) {
    std::mt19937 rng(42);
    for (int iter = 0; iter < 100; ++iter) {
        for (const ShapeParameters& params : sampleParameters(rng)) {
            const auto verts = generateVertices(params);
            for (std::size_t i = 0; i < verts.size(); ++i) {
                ShapeParameters out = PointParams{{0.0, 0.0}};
                ASSERT_EQ(deriveFromVertexEdit(params, i, verts[i], out), ObjectError::Ok);
                EXPECT_TRUE(out == params) << shapeKindName(kindOf(params)) << " index " << i;
            }
        }
    }
}

TEST(VertexEditTest, EditedVertexRegeneratesAtRequestedPosition) {
    std::mt19937 rng(7);
    for (int iter = 0; iter < 100; ++iter) {
        const WorldPoint c{dyadic(rng, -20, 20), dyadic(rng, -20, 20)};
        const RectangleParams rect{c, dyadic(rng, 1, 10), dyadic(rng, 1, 10)};
        const auto corners = generateVertices(rect);
        for (std::size_t i = 0; i < 4; ++i) {
            const WorldPoint anchor = corners[(i + 2) % 4];
            // Keep the moved corner strictly away from the anchor on both axes.
            const WorldPoint target{anchor.x + (rng() % 2 ? 1.0 : -1.0) * dyadic(rng, 1, 10),
                                    anchor.y + (rng() % 2 ? 1.0 : -1.0) * dyadic(rng, 1, 10)};
            ShapeParameters out = rect;
            ASSERT_EQ(deriveFromVertexEdit(rect, i, target, out), ObjectError::Ok);
            const auto regenerated = generateVertices(out);
            // The anchor survives, and the moved corner lands on the target at
            // whichever index the flipped orientation puts it.
            bool foundAnchor = false;
            bool foundTarget = false;
            for (const WorldPoint& p : regenerated) {
                foundAnchor = foundAnchor || p == anchor;
                foundTarget = foundTarget || p == target;
            }
            EXPECT_TRUE(foundAnchor);
            EXPECT_TRUE(foundTarget);
        }
    }
}

TEST(VertexEditTest, CircleAnySampleEditsRadius) {
    ShapeParameters out = PointParams{{0.0, 0.0}};
    ASSERT_EQ(deriveFromVertexEdit(CircleParams{{0.0, 0.0}, 10.0}, 0, WorldPoint{20.0, 0.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<CircleParams>(out), (CircleParams{{0.0, 0.0}, 20.0}));

    ASSERT_EQ(deriveFromVertexEdit(CircleParams{{0.0, 0.0}, 5.0}, 6, WorldPoint{0.0, -15.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<CircleParams>(out), (CircleParams{{0.0, 0.0}, 15.0}));
}

TEST(VertexEditTest, CircleEditOntoCenterIsDegenerate) {
    ShapeParameters out = PointParams{{9.0, 9.0}};
    EXPECT_EQ(deriveFromVertexEdit(CircleParams{{2.0, 3.0}, 5.0}, 3, WorldPoint{2.0, 3.0}, out),
              ObjectError::DegenerateEdit);
    EXPECT_EQ(std::get<PointParams>(out), (PointParams{{9.0, 9.0}}));
}

TEST(VertexEditTest, RectangleCornerKeepsOppositeCornerFixed) {
    // TL moves from (3,4) to (1,2); BR (7,6) stays.
    ShapeParameters out = PointParams{{0.0, 0.0}};
    ASSERT_EQ(deriveFromVertexEdit(RectangleParams{{5.0, 5.0}, 4.0, 2.0}, 0, WorldPoint{1.0, 2.0}, out),
              ObjectError::Ok);
    EXPECT_EQ(std::get<RectangleParams>(out), (RectangleParams{{4.0, 4.0}, 6.0, 4.0}));
}

TEST(VertexEditTest, RectangleCollapsingEditIsDegenerate) {
    ShapeParameters out = PointParams{{0.0, 0.0}};
    // BR moved onto TL's y row.
    EXPECT_EQ(deriveFromVertexEdit(RectangleParams{{5.0, 5.0}, 4.0, 2.0}, 2, WorldPoint{9.0, 4.0}, out),
              ObjectError::DegenerateEdit);
}

TEST(VertexEditTest, DiamondHorizontalHandleLeavesVerticalAxisAlone) {
    const DiamondParams d{{0.0, 0.0}, 8.0, 4.0};
    ShapeParameters out = PointParams{{0.0, 0.0}};
    // West to (-6, 3): East (4, 0) stays, y of the handle is ignored.
    ASSERT_EQ(deriveFromVertexEdit(d, 0, WorldPoint{-6.0, 3.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<DiamondParams>(out), (DiamondParams{{-1.0, 0.0}, 10.0, 4.0}));

    // South to (1, 5): North (0, -2) stays.
    ASSERT_EQ(deriveFromVertexEdit(d, 3, WorldPoint{1.0, 5.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<DiamondParams>(out), (DiamondParams{{0.0, 1.5}, 8.0, 7.0}));

    // East onto West collapses the width.
    EXPECT_EQ(deriveFromVertexEdit(d, 2, WorldPoint{-4.0, 0.0}, out), ObjectError::DegenerateEdit);
}

TEST(VertexEditTest, OffAxisHandleEditsProjectOntoTheHandleAxis) {
    namespace di = interaction_constants::DiamondIndex;
    const DiamondParams d{{0.0, 0.0}, 8.0, 4.0};
    ShapeParameters out = PointParams{{0.0, 0.0}};

    // West lands at the requested x on the horizontal axis, not at (-6, 3).
    ASSERT_EQ(deriveFromVertexEdit(d, di::WEST, WorldPoint{-6.0, 3.0}, out), ObjectError::Ok);
    EXPECT_EQ(generateVertices(out)[di::WEST], (WorldPoint{-6.0, 0.0}));

    // North keeps x = center.x.
    ASSERT_EQ(deriveFromVertexEdit(d, di::NORTH, WorldPoint{1.0, -5.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<DiamondParams>(out), (DiamondParams{{0.0, -1.5}, 8.0, 7.0}));
    EXPECT_EQ(generateVertices(out)[di::NORTH], (WorldPoint{0.0, -5.0}));

    // A circle sample keeps its angle; only the distance to the center is used.
    // Sample 2 of 8 points South (+y) and is dragged to (0, -10).
    ASSERT_EQ(deriveFromVertexEdit(CircleParams{{0.0, 0.0}, 5.0}, 2, WorldPoint{0.0, -10.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<CircleParams>(out), (CircleParams{{0.0, 0.0}, 10.0}));
    const WorldPoint sample = generateVertices(out)[2];
    EXPECT_NEAR(sample.x, 0.0, 1e-12);
    EXPECT_NEAR(sample.y, 10.0, 1e-12);
}

TEST(VertexEditTest, PointAndLineFollowTheHandle) {
    ShapeParameters out = PointParams{{0.0, 0.0}};
    ASSERT_EQ(deriveFromVertexEdit(PointParams{{1.0, 1.0}}, 0, WorldPoint{-2.0, 5.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<PointParams>(out), (PointParams{{-2.0, 5.0}}));

    const LineParams line{{0.0, 0.0}, {4.0, 0.0}};
    ASSERT_EQ(deriveFromVertexEdit(line, 1, WorldPoint{4.0, 3.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<LineParams>(out), (LineParams{{0.0, 0.0}, {4.0, 3.0}}));
    ASSERT_EQ(deriveFromVertexEdit(line, 0, WorldPoint{-1.0, 0.0}, out), ObjectError::Ok);
    EXPECT_EQ(std::get<LineParams>(out), (LineParams{{-1.0, 0.0}, {4.0, 0.0}}));
}

TEST(VertexEditTest, NonFinitePointIsInvalid) {
    ShapeParameters out = PointParams{{0.0, 0.0}};
    const WorldPoint bad{std::numeric_limits<double>::infinity(), 0.0};
    EXPECT_EQ(deriveFromVertexEdit(LineParams{{0.0, 0.0}, {1.0, 1.0}}, 0, bad, out), ObjectError::InvalidParameters);
}

TEST(VertexEditTest, IndexOutOfRangeThrows) {
    ShapeParameters out = PointParams{{0.0, 0.0}};
    EXPECT_THROW(deriveFromVertexEdit(RectangleParams{{0.0, 0.0}, 1.0, 1.0}, 4, WorldPoint{1.0, 1.0}, out),
                 std::out_of_range);
    EXPECT_THROW(deriveFromVertexEdit(CircleParams{{0.0, 0.0}, 1.0}, 8, WorldPoint{1.0, 1.0}, out),
                 std::out_of_range);
    EXPECT_NO_THROW(deriveFromVertexEdit(CircleParams{{0.0, 0.0}, 1.0}, 8, WorldPoint{2.0, 0.0}, out, 16));
}

TEST(ShapeAuthoringTest, DragProducesCanonicalParameters) {
    const WorldPoint a{2.0, 2.0};
    const WorldPoint b{6.0, 5.0};
    EXPECT_EQ(std::get<PointParams>(parametersFromDrag(ShapeKind::Point, a, b)), (PointParams{b}));
    EXPECT_EQ(std::get<LineParams>(parametersFromDrag(ShapeKind::Line, a, b)), (LineParams{a, b}));
    EXPECT_EQ(std::get<CircleParams>(parametersFromDrag(ShapeKind::Circle, a, b)), (CircleParams{{4.0, 3.5}, 2.5}));
    EXPECT_EQ(std::get<RectangleParams>(parametersFromDrag(ShapeKind::Rectangle, b, a)),
              (RectangleParams{{4.0, 3.5}, 4.0, 3.0}));
    EXPECT_EQ(std::get<DiamondParams>(parametersFromDrag(ShapeKind::Diamond, a, b)),
              (DiamondParams{{4.0, 2.0}, 4.0, 2.0}));
}

TEST(ShapeAuthoringTest, SnapUsesPerKindAnchorOnlyWhenEnabled) {
    DrawingSettings settings;
    const WorldPoint p{3.3, 7.8};
    EXPECT_EQ(snapAuthoringPoint(p, ShapeKind::Rectangle, settings), p);

    settings.snapToAnchor = true;
    EXPECT_EQ(snapAuthoringPoint(p, ShapeKind::Rectangle, settings), (WorldPoint{3.0, 7.0}));
    EXPECT_EQ(snapAuthoringPoint(p, ShapeKind::Circle, settings), (WorldPoint{3.5, 7.5}));
    EXPECT_EQ(snapAuthoringPoint(p, ShapeKind::Diamond, settings), (WorldPoint{3.0, 7.5}));
}

TEST(ShapeMetricsTest, DerivedFiguresPerKind) {
    const ShapeMetrics line = computeMetrics(LineParams{{0.0, 0.0}, {3.0, 4.0}});
    EXPECT_DOUBLE_EQ(line.length, 5.0);
    EXPECT_NEAR(line.angleDeg, 53.13010235415598, 1e-9);
    EXPECT_EQ(line.midpoint, (WorldPoint{1.5, 2.0}));

    const ShapeMetrics circle = computeMetrics(CircleParams{{0.0, 0.0}, 2.0});
    EXPECT_DOUBLE_EQ(circle.diameter, 4.0);
    EXPECT_NEAR(circle.circumference, 4.0 * kPi, 1e-12);
    EXPECT_NEAR(circle.area, 4.0 * kPi, 1e-12);

    const ShapeMetrics rect = computeMetrics(RectangleParams{{0.0, 0.0}, 4.0, 2.0});
    EXPECT_DOUBLE_EQ(rect.area, 8.0);
    EXPECT_DOUBLE_EQ(rect.perimeter, 12.0);

    const ShapeMetrics diamond = computeMetrics(DiamondParams{{0.0, 0.0}, 6.0, 8.0});
    EXPECT_DOUBLE_EQ(diamond.area, 24.0);
    EXPECT_DOUBLE_EQ(diamond.perimeter, 20.0);
}
