#pragma once

#include "pixeloid/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

struct GeometricObject;

enum class PickSubTarget : std::uint8_t {
    None = 0,
    Body = 1,
    Edge = 2,
    Vertex = 3,
};

// Return struct for picking
struct PickResult {
    std::string id;          // empty on miss
    ShapeKind kind;
    PickSubTarget subTarget;
    std::int32_t subIndex;   // vertex index for PickSubTarget::Vertex, else -1
    double distance;
    WorldPoint hit;          // world pick point

    bool hitSomething() const noexcept { return !id.empty(); }
};

// Internal candidate during picking
struct PickCandidate {
    const GeometricObject* object;
    PickSubTarget subTarget;
    std::int32_t subIndex;
    double distance;
    std::uint32_t zIndex;

    // Sort order:
    // 1. Z-Index: later-created shapes sit on top
    // 2. SubTarget Priority: Vertex > Edge > Body
    // 3. Distance: Closer is better
    bool operator<(const PickCandidate& other) const {
        if (zIndex != other.zIndex) return zIndex > other.zIndex;

        auto priority = [](PickSubTarget t) {
            switch (t) {
                case PickSubTarget::Vertex: return 8;
                case PickSubTarget::Edge: return 5;
                case PickSubTarget::Body: return 1;
                default: return 0;
            }
        };
        const int p1 = priority(subTarget);
        const int p2 = priority(other.subTarget);
        if (p1 != p2) return p1 > p2;

        return distance < other.distance;
    }
};

struct PickStats {
    std::uint32_t candidatesChecked;
    std::uint32_t hits;
};

// Shape-specific containment tests in world space. Tolerances are world
// lengths; callers convert from screen pixels with the current cell size.
class PickSystem {
public:
    PickSystem() = default;

    // Topmost shape under `p`. `candidates` must be in creation order (bottom
    // to top), typically the output of cullVisible.
    PickResult pick(const WorldPoint& p, double tolerance,
                    const std::vector<const GeometricObject*>& candidates) const;

    // Vertex of `object` within `radius` of `p`, closest first; -1 on miss.
    std::int32_t pickVertex(const GeometricObject& object, const WorldPoint& p, double radius) const;

    // Exact containment test for a single shape.
    bool checkCandidate(const GeometricObject& object, const WorldPoint& p, double tolerance,
                        std::uint32_t zIndex, PickCandidate& outCandidate) const;

    PickStats getLastStats() const { return lastStats_; }

private:
    mutable PickStats lastStats_{0, 0};
};
