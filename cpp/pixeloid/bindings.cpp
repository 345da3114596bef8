#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "pixeloid/engine.h"
#include "pixeloid/geometry/shape_metrics.h"

#ifdef EMSCRIPTEN
#include <type_traits>

namespace {

// Flat view of one shape for JS. Parameters are spread over fixed slots:
//   Point (cx, cy), Line (x0, y0, x1, y1), Circle (cx, cy, r),
//   Rectangle / Diamond (cx, cy, w, h)
struct ShapeView {
    std::string id;
    std::uint32_t kind;
    double p0, p1, p2, p3;
    double minX, minY, maxX, maxY;
    std::uint32_t strokeColor;
    double strokeWidth;
    double strokeAlpha;
    bool visible;
};

ShapeParameters paramsFromSlots(std::uint32_t kind, double p0, double p1, double p2, double p3) {
    switch (static_cast<ShapeKind>(kind)) {
        case ShapeKind::Line: return LineParams{{p0, p1}, {p2, p3}};
        case ShapeKind::Circle: return CircleParams{{p0, p1}, p2};
        case ShapeKind::Rectangle: return RectangleParams{{p0, p1}, p2, p3};
        case ShapeKind::Diamond: return DiamondParams{{p0, p1}, p2, p3};
        case ShapeKind::Point:
        default: return PointParams{{p0, p1}};
    }
}

ShapeView toView(const GeometricObject& obj) {
    ShapeView v{obj.id, static_cast<std::uint32_t>(obj.kind), 0, 0, 0, 0,
                obj.bounds.minX, obj.bounds.minY, obj.bounds.maxX, obj.bounds.maxY,
                obj.style.strokeColor, obj.style.strokeWidth, obj.style.strokeAlpha, obj.visible};
    std::visit([&v](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PointParams>) {
            v.p0 = p.center.x; v.p1 = p.center.y;
        } else if constexpr (std::is_same_v<T, LineParams>) {
            v.p0 = p.start.x; v.p1 = p.start.y; v.p2 = p.end.x; v.p3 = p.end.y;
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            v.p0 = p.center.x; v.p1 = p.center.y; v.p2 = p.radius;
        } else {
            v.p0 = p.center.x; v.p1 = p.center.y; v.p2 = p.width; v.p3 = p.height;
        }
    }, obj.parameters);
    return v;
}

} // namespace

EMSCRIPTEN_BINDINGS(pixeloid_engine_module) {
    emscripten::enum_<ShapeKind>("ShapeKind")
        .value("Point", ShapeKind::Point)
        .value("Line", ShapeKind::Line)
        .value("Circle", ShapeKind::Circle)
        .value("Rectangle", ShapeKind::Rectangle)
        .value("Diamond", ShapeKind::Diamond);

    emscripten::enum_<ObjectError>("ObjectError")
        .value("Ok", ObjectError::Ok)
        .value("InvalidParameters", ObjectError::InvalidParameters)
        .value("UnknownObjectId", ObjectError::UnknownObjectId)
        .value("DegenerateEdit", ObjectError::DegenerateEdit);

    emscripten::enum_<InteractionState>("InteractionState")
        .value("Idle", InteractionState::Idle)
        .value("Drawing", InteractionState::Drawing)
        .value("Previewing", InteractionState::Previewing)
        .value("Selected", InteractionState::Selected)
        .value("Dragging", InteractionState::Dragging)
        .value("DraggingVertex", InteractionState::DraggingVertex)
        .value("EditingParameters", InteractionState::EditingParameters);

    emscripten::class_<PixeloidEngine>("PixeloidEngine")
        .constructor<>()
        .function("clear", emscripten::optional_override([](PixeloidEngine& self) { self.clear(); }))
        // Navigation
        .function("setCellSize", &PixeloidEngine::setCellSize)
        .function("pan", emscripten::optional_override([](PixeloidEngine& self, double dx, double dy) {
            return self.pan(WorldPoint{dx, dy});
        }))
        .function("snapToCell", &PixeloidEngine::snapToCell)
        .function("setSurfaceSize", &PixeloidEngine::setSurfaceSize)
        .function("resetView", &PixeloidEngine::resetView)
        .function("getViewportWindow", &PixeloidEngine::viewportWindow)
        .function("toWorld", emscripten::optional_override([](const PixeloidEngine& self, double x, double y) {
            return self.toWorld(ScreenPoint{x, y});
        }))
        .function("toScreen", emscripten::optional_override([](const PixeloidEngine& self, double x, double y) {
            return self.toScreen(WorldPoint{x, y});
        }))
        .function("toCell", emscripten::optional_override([](const PixeloidEngine& self, double x, double y) {
            // Cell indices travel as doubles; no BigInt on the JS side.
            const CellPoint c = self.toCell(ScreenPoint{x, y});
            return WorldPoint{static_cast<double>(c.x), static_cast<double>(c.y)};
        }))
        // Store
        .function("create", emscripten::optional_override([](PixeloidEngine& self, std::uint32_t kind,
                double p0, double p1, double p2, double p3,
                std::uint32_t strokeColor, double strokeWidth, double strokeAlpha) {
            const CreateResult res = self.create(static_cast<ShapeKind>(kind),
                paramsFromSlots(kind, p0, p1, p2, p3),
                StrokeStyle{strokeColor, strokeWidth, strokeAlpha, std::nullopt, std::nullopt});
            return res.id;
        }))
        .function("updateByParameters", emscripten::optional_override([](PixeloidEngine& self, const std::string& id,
                double p0, double p1, double p2, double p3) {
            const GeometricObject* obj = self.get(id);
            if (!obj) return static_cast<std::uint32_t>(ObjectError::UnknownObjectId);
            return static_cast<std::uint32_t>(self.updateByParameters(
                id, paramsFromSlots(static_cast<std::uint32_t>(obj->kind), p0, p1, p2, p3)));
        }))
        .function("updateByVertexEdit", emscripten::optional_override([](PixeloidEngine& self, const std::string& id,
                std::uint32_t index, double x, double y) {
            const GeometricObject* obj = self.get(id);
            if (!obj) return static_cast<std::uint32_t>(ObjectError::UnknownObjectId);
            if (index >= obj->vertices.size()) return static_cast<std::uint32_t>(ObjectError::InvalidParameters);
            return static_cast<std::uint32_t>(self.updateByVertexEdit(id, index, WorldPoint{x, y}));
        }))
        .function("translate", emscripten::optional_override([](PixeloidEngine& self, const std::string& id, double dx, double dy) {
            return static_cast<std::uint32_t>(self.translate(id, WorldPoint{dx, dy}));
        }))
        .function("setVisible", emscripten::optional_override([](PixeloidEngine& self, const std::string& id, bool visible) {
            return static_cast<std::uint32_t>(self.setVisible(id, visible));
        }))
        .function("remove", emscripten::optional_override([](PixeloidEngine& self, const std::string& id) {
            return static_cast<std::uint32_t>(self.remove(id));
        }))
        .function("getShape", emscripten::optional_override([](const PixeloidEngine& self, const std::string& id) {
            const GeometricObject* obj = self.get(id);
            return obj ? emscripten::val(toView(*obj)) : emscripten::val::null();
        }))
        .function("getMetrics", emscripten::optional_override([](const PixeloidEngine& self, const std::string& id) {
            const GeometricObject* obj = self.get(id);
            return obj ? emscripten::val(pixeloid::computeMetrics(obj->parameters)) : emscripten::val::null();
        }))
        .function("getLastError", emscripten::optional_override([](const PixeloidEngine& self) {
            return static_cast<std::uint32_t>(self.lastError());
        }))
        // Outputs
        .function("getVisibleShapes", emscripten::optional_override([](const PixeloidEngine& self) {
            std::vector<ShapeView> out;
            for (const GeometricObject* obj : self.visibleShapes()) out.push_back(toView(*obj));
            return out;
        }))
        .function("hitTest", emscripten::optional_override([](const PixeloidEngine& self, double x, double y) {
            const std::optional<std::string> id = self.hitTest(ScreenPoint{x, y});
            return id ? emscripten::val(*id) : emscripten::val::null();
        }))
        .function("getPreview", emscripten::optional_override([](const PixeloidEngine& self) {
            const std::optional<GeometricObject> preview = self.currentPreview();
            return preview ? emscripten::val(toView(*preview)) : emscripten::val::null();
        }))
        // Interaction
        .function("setDrawMode", emscripten::optional_override([](PixeloidEngine& self, std::uint32_t kind) {
            // 0 leaves drawing mode.
            if (kind == 0) self.setDrawMode(std::nullopt);
            else self.setDrawMode(static_cast<ShapeKind>(kind));
        }))
        .function("pointer", emscripten::optional_override([](PixeloidEngine& self, std::uint32_t phase,
                std::uint32_t button, double x, double y) {
            self.handlePointer(PointerEvent{ScreenPoint{x, y}, static_cast<PointerButton>(button), static_cast<PointerPhase>(phase)});
        }))
        .function("key", emscripten::optional_override([](PixeloidEngine& self, std::uint32_t key, bool down) {
            self.handleKey(static_cast<InteractionKey>(key), down ? KeyPhase::Down : KeyPhase::Up);
        }))
        .function("tick", &PixeloidEngine::tick)
        .function("selectShape", &PixeloidEngine::selectShape)
        .function("openPropertyEditor", &PixeloidEngine::openPropertyEditor)
        .function("cancelPropertyEdit", &PixeloidEngine::cancelPropertyEdit)
        .function("getInteractionState", emscripten::optional_override([](const PixeloidEngine& self) {
            return self.interactionState();
        }))
        .function("getSelectedId", emscripten::optional_override([](const PixeloidEngine& self) {
            return self.selectedId();
        }))
        // Events
        .function("pollEvents", &PixeloidEngine::pollEvents)
        .function("ackResync", &PixeloidEngine::ackResync)
        .function("getDocumentDigest", emscripten::optional_override([](const PixeloidEngine& self) {
            return static_cast<double>(self.documentDigest() & 0x1fffffffffffffull);
        }));

    emscripten::value_object<WorldPoint>("WorldPoint")
        .field("x", &WorldPoint::x)
        .field("y", &WorldPoint::y);

    emscripten::value_object<ScreenPoint>("ScreenPoint")
        .field("x", &ScreenPoint::x)
        .field("y", &ScreenPoint::y);

    emscripten::value_object<AABB>("AABB")
        .field("minX", &AABB::minX)
        .field("minY", &AABB::minY)
        .field("maxX", &AABB::maxX)
        .field("maxY", &AABB::maxY);

    emscripten::value_object<ShapeView>("ShapeView")
        .field("id", &ShapeView::id)
        .field("kind", &ShapeView::kind)
        .field("p0", &ShapeView::p0)
        .field("p1", &ShapeView::p1)
        .field("p2", &ShapeView::p2)
        .field("p3", &ShapeView::p3)
        .field("minX", &ShapeView::minX)
        .field("minY", &ShapeView::minY)
        .field("maxX", &ShapeView::maxX)
        .field("maxY", &ShapeView::maxY)
        .field("strokeColor", &ShapeView::strokeColor)
        .field("strokeWidth", &ShapeView::strokeWidth)
        .field("strokeAlpha", &ShapeView::strokeAlpha)
        .field("visible", &ShapeView::visible);

    emscripten::value_object<ShapeMetrics>("ShapeMetrics")
        .field("length", &ShapeMetrics::length)
        .field("angleDeg", &ShapeMetrics::angleDeg)
        .field("midpoint", &ShapeMetrics::midpoint)
        .field("diameter", &ShapeMetrics::diameter)
        .field("circumference", &ShapeMetrics::circumference)
        .field("area", &ShapeMetrics::area)
        .field("perimeter", &ShapeMetrics::perimeter);

    emscripten::value_object<PixeloidEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &PixeloidEngine::EventBufferMeta::generation)
        .field("count", &PixeloidEngine::EventBufferMeta::count)
        .field("ptr", &PixeloidEngine::EventBufferMeta::ptr);

    emscripten::register_vector<ShapeView>("VectorShapeView");
}
#endif
