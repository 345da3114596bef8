#ifndef PIXELOID_CORE_TYPES_H
#define PIXELOID_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>

// Lightweight value types shared by every part of the canvas engine.
// One world unit (a "pixeloid") is exactly one grid cell.

// Device pixels, origin at the output surface top-left.
struct ScreenPoint {
    double x;
    double y;
};

// Integer grid cell indices.
struct CellPoint {
    std::int64_t x;
    std::int64_t y;
};

// Pan-independent canonical space. All shape geometry is stored here.
struct WorldPoint {
    double x;
    double y;
};

inline bool operator==(const ScreenPoint& a, const ScreenPoint& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const ScreenPoint& a, const ScreenPoint& b) { return !(a == b); }
inline bool operator==(const CellPoint& a, const CellPoint& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const CellPoint& a, const CellPoint& b) { return !(a == b); }
inline bool operator==(const WorldPoint& a, const WorldPoint& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const WorldPoint& a, const WorldPoint& b) { return !(a == b); }

// Axis-aligned bounds in world space.
struct AABB {
    double minX, minY, maxX, maxY;
};

inline bool operator==(const AABB& a, const AABB& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}

enum class ShapeKind : std::uint8_t { Point = 1, Line = 2, Circle = 3, Rectangle = 4, Diamond = 5 };

inline const char* shapeKindName(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Point: return "point";
        case ShapeKind::Line: return "line";
        case ShapeKind::Circle: return "circle";
        case ShapeKind::Rectangle: return "rectangle";
        case ShapeKind::Diamond: return "diamond";
    }
    return "unknown";
}

// Result codes for every store mutation. Expected user-input failures are
// reported here; nothing on these paths throws.
enum class ObjectError : std::uint32_t {
    Ok = 0,
    InvalidParameters = 1,  // non-positive size, NaN/Inf coordinates, kind mismatch
    UnknownObjectId = 2,
    DegenerateEdit = 3,     // vertex edit that collapses the shape
};

inline const char* objectErrorName(ObjectError err) {
    switch (err) {
        case ObjectError::Ok: return "Ok";
        case ObjectError::InvalidParameters: return "InvalidParameters";
        case ObjectError::UnknownObjectId: return "UnknownObjectId";
        case ObjectError::DegenerateEdit: return "DegenerateEdit";
    }
    return "Unknown";
}

// Colors are packed 0xRRGGBB, alphas in [0, 1].
struct StrokeStyle {
    std::uint32_t strokeColor;
    double strokeWidth;
    double strokeAlpha;
    std::optional<std::uint32_t> fillColor;
    std::optional<double> fillAlpha;
};

inline bool operator==(const StrokeStyle& a, const StrokeStyle& b) {
    return a.strokeColor == b.strokeColor && a.strokeWidth == b.strokeWidth
        && a.strokeAlpha == b.strokeAlpha && a.fillColor == b.fillColor
        && a.fillAlpha == b.fillAlpha;
}

struct CreateResult {
    ObjectError error;
    std::string id; // empty unless error == Ok

    bool ok() const noexcept { return error == ObjectError::Ok; }
};

#endif // PIXELOID_CORE_TYPES_H
