// engine_digest.cpp - Document digest for PixeloidEngine
// Two engines fed the same input sequence must report the same digest.

#include "pixeloid/engine.h"
#include "pixeloid/internal/engine_state.h"
#include <type_traits>

using pixeloid::kDigestOffset;
using pixeloid::hashU32;
using pixeloid::hashF64;
using pixeloid::hashBytes;

namespace {

std::uint64_t hashPoint(std::uint64_t h, const WorldPoint& p) {
    h = hashF64(h, p.x);
    return hashF64(h, p.y);
}

std::uint64_t hashParameters(std::uint64_t h, const ShapeParameters& params) {
    return std::visit([h](const auto& p) -> std::uint64_t {
        using T = std::decay_t<decltype(p)>;
        std::uint64_t out = h;
        if constexpr (std::is_same_v<T, PointParams>) {
            out = hashPoint(out, p.center);
        } else if constexpr (std::is_same_v<T, LineParams>) {
            out = hashPoint(out, p.start);
            out = hashPoint(out, p.end);
        } else if constexpr (std::is_same_v<T, CircleParams>) {
            out = hashPoint(out, p.center);
            out = hashF64(out, p.radius);
        } else {
            out = hashPoint(out, p.center);
            out = hashF64(out, p.width);
            out = hashF64(out, p.height);
        }
        return out;
    }, params);
}

std::uint64_t hashStyle(std::uint64_t h, const StrokeStyle& s) {
    h = hashU32(h, s.strokeColor);
    h = hashF64(h, s.strokeWidth);
    h = hashF64(h, s.strokeAlpha);
    h = hashU32(h, s.fillColor ? 1u : 0u);
    if (s.fillColor) h = hashU32(h, *s.fillColor);
    h = hashU32(h, s.fillAlpha ? 1u : 0u);
    if (s.fillAlpha) h = hashF64(h, *s.fillAlpha);
    return h;
}

} // namespace

std::uint64_t PixeloidEngine::documentDigest() const {
    const EngineState& st = state();
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x50584C44u); // "PXLD" marker

    h = hashF64(h, st.navigation.cellSizePx());
    h = hashPoint(h, st.navigation.panOffset());

    const std::vector<GeometricObject>& objects = st.store.all();
    h = hashU32(h, static_cast<std::uint32_t>(objects.size()));
    for (const GeometricObject& obj : objects) {
        h = hashU32(h, static_cast<std::uint32_t>(obj.id.size()));
        h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(obj.id.data()), obj.id.size());
        h = hashU32(h, static_cast<std::uint32_t>(obj.kind));
        h = hashParameters(h, obj.parameters);
        h = hashU32(h, static_cast<std::uint32_t>(obj.vertices.size()));
        for (const WorldPoint& v : obj.vertices) h = hashPoint(h, v);
        h = hashStyle(h, obj.style);
        h = hashU32(h, obj.visible ? 1u : 0u);
    }

    h = hashU32(h, static_cast<std::uint32_t>(st.interactionSession.state()));
    const std::string& selected = st.interactionSession.selectedId();
    h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(selected.data()), selected.size());
    return h;
}
