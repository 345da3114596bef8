#include <gtest/gtest.h>
#include "tests/engine_test_common.h"
#include <limits>

using namespace engine_test;

TEST(PixeloidEngineConfigTest, InitialState) {
    PixeloidEngine engine;
    EXPECT_EQ(engine.interactionState(), InteractionState::Idle);
    EXPECT_TRUE(engine.all().empty());
    EXPECT_EQ(engine.lastError(), ObjectError::Ok);
    EXPECT_DOUBLE_EQ(engine.navigation().cellSizePx(), interaction_constants::DEFAULT_CELL_SIZE_PX);
    EXPECT_EQ(engine.navigation().panOffset(), (WorldPoint{0.0, 0.0}));
    EXPECT_FALSE(engine.drawMode().has_value());
}

TEST(PixeloidEngineConfigTest, InvalidConstructorConfigFallsBackToDefaults) {
    EngineConfig cfg;
    cfg.cellSizePx = -3.0;
    PixeloidEngine engine(cfg);
    EXPECT_DOUBLE_EQ(engine.config().cellSizePx, interaction_constants::DEFAULT_CELL_SIZE_PX);
}

TEST(PixeloidEngineConfigTest, ValidateConfigChecksEveryField) {
    EXPECT_TRUE(pixeloid::validateConfig(EngineConfig{}));

    EngineConfig cfg;
    cfg.drawing.circleSegments = 2;
    EXPECT_FALSE(pixeloid::validateConfig(cfg));

    cfg = EngineConfig{};
    cfg.drawing.previewOpacity = 1.5;
    EXPECT_FALSE(pixeloid::validateConfig(cfg));

    cfg = EngineConfig{};
    cfg.pickTolerancePx = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(pixeloid::validateConfig(cfg));

    cfg = EngineConfig{};
    cfg.defaultStyle.strokeWidth = 0.0;
    EXPECT_FALSE(pixeloid::validateConfig(cfg));
}

TEST_F(PixeloidEngineTest, SetConfigRefusesInvalidAndKeepsPrevious) {
    EngineConfig cfg = engine.config();
    cfg.drawing.minDrawDistance = -1.0;
    EXPECT_FALSE(engine.setConfig(cfg));
    EXPECT_DOUBLE_EQ(engine.config().drawing.minDrawDistance, interaction_constants::MIN_DRAW_DISTANCE);
}

TEST_F(PixeloidEngineTest, CircleSegmentChangeRegeneratesAndReports) {
    const std::string circle = createCircle(engine, 0.0, 0.0, 2.0);
    const std::string rect = createRect(engine, 5.0, 5.0, 2.0, 2.0);
    drainEvents(engine);

    EngineConfig cfg = engine.config();
    cfg.drawing.circleSegments = 32;
    ASSERT_TRUE(engine.setConfig(cfg));
    EXPECT_EQ(engine.get(circle)->vertices.size(), 32u);
    EXPECT_EQ(engine.get(rect)->vertices.size(), 4u);

    const auto meta = engine.pollEvents(16);
    ASSERT_EQ(meta.count, 2u);
    const auto* events = reinterpret_cast<const PixeloidEngine::EngineEvent*>(meta.ptr);
    EXPECT_EQ(events[1].type, static_cast<std::uint16_t>(PixeloidEngine::EventType::EntityChanged));
    EXPECT_EQ(events[1].a, ObjectStore::serialOf(circle));
}

TEST_F(PixeloidEngineTest, SetConfigAppliesCellSize) {
    EngineConfig cfg = engine.config();
    cfg.cellSizePx = 25.0;
    ASSERT_TRUE(engine.setConfig(cfg));
    EXPECT_DOUBLE_EQ(engine.navigation().cellSizePx(), 25.0);
}

TEST_F(PixeloidEngineTest, SurfaceSizeRejectsNegative) {
    EXPECT_FALSE(engine.setSurfaceSize(-1.0, 10.0));
    EXPECT_FALSE(engine.setSurfaceSize(10.0, std::numeric_limits<double>::infinity()));
    EXPECT_DOUBLE_EQ(engine.surfaceWidth(), kSurfaceW);
    EXPECT_DOUBLE_EQ(engine.surfaceHeight(), kSurfaceH);
}

TEST_F(PixeloidEngineTest, ScreenToCellThroughEngine) {
    ASSERT_TRUE(engine.setCellSize(20.0));
    ASSERT_TRUE(engine.pan(WorldPoint{3.0, 0.0}));
    EXPECT_EQ(engine.toWorld(ScreenPoint{0.0, 0.0}), (WorldPoint{3.0, 0.0}));
    EXPECT_EQ(engine.toCell(ScreenPoint{-1.0, 19.0}), (CellPoint{2, 0}));
}

TEST_F(PixeloidEngineTest, EndToEndRectangleScenario) {
    const CreateResult res = engine.create(ShapeKind::Rectangle, RectangleParams{{5.0, 5.0}, 4.0, 2.0}, defaultStyle());
    ASSERT_TRUE(res.ok());
    const GeometricObject* obj = engine.get(res.id);
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->bounds, (AABB{3.0, 4.0, 7.0, 6.0}));
    EXPECT_EQ(engine.queryByBounds(AABB{0.0, 0.0, 3.0, 4.0}), std::vector<std::string>{res.id});
}

TEST_F(PixeloidEngineTest, EndToEndCircleHandleScenario) {
    const std::string id = createCircle(engine, 0.0, 0.0, 5.0);
    // Sample at 3*pi/2 sits at (0, -5).
    ASSERT_EQ(engine.updateByVertexEdit(id, 6, WorldPoint{0.0, -15.0}), ObjectError::Ok);
    EXPECT_EQ(std::get<CircleParams>(engine.get(id)->parameters), (CircleParams{{0.0, 0.0}, 15.0}));
}

TEST_F(PixeloidEngineTest, StatsAndDrawStyle) {
    createCircle(engine, 0.0, 0.0, 1.0);
    createRect(engine, 0.0, 0.0, 1.0, 1.0);
    const ObjectStoreStats s = engine.stats();
    EXPECT_EQ(s.total, 2u);
    EXPECT_EQ(s.totalVertices, 12u);

    StrokeStyle bad = defaultStyle();
    bad.strokeAlpha = -0.5;
    engine.setDrawStyle(bad);
    EXPECT_EQ(engine.lastError(), ObjectError::InvalidParameters);

    const StrokeStyle red{0xff0000, 1.0, 1.0, 0xffeeddu, 0.5};
    engine.setDrawStyle(red);
    engine.setDrawMode(ShapeKind::Point);
    clickAt(engine, 1.0, 1.0);
    ASSERT_EQ(engine.all().size(), 3u);
    EXPECT_EQ(engine.all()[2].style, red);
}
