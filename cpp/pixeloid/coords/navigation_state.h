#ifndef PIXELOID_COORDS_NAVIGATION_STATE_H
#define PIXELOID_COORDS_NAVIGATION_STATE_H

#include "pixeloid/core/types.h"
#include "pixeloid/core/config.h"
#include <array>
#include <cstdint>

// Owns the two scalars every coordinate conversion depends on.
class NavigationState {
public:
    NavigationState() = default;
    explicit NavigationState(double cellSizePx);

    double cellSizePx() const noexcept { return cellSizePx_; }
    const WorldPoint& panOffset() const noexcept { return panOffset_; }

    // Accumulates a world-space delta. Non-finite deltas are ignored (returns false).
    bool pan(const WorldPoint& deltaWorld);

    // Rounds the pan offset to the nearest cell boundary. Only call this on an
    // input-released edge, never mid-drag.
    void snapToCell();

    // Fails for px <= 0 or non-finite px; state is left unchanged.
    bool setCellSize(double px);

    // Places a world point at the centre of a surface of the given pixel size.
    bool centerOn(const WorldPoint& worldPoint, double surfaceWidthPx, double surfaceHeightPx);

    void reset() noexcept { panOffset_ = {0.0, 0.0}; }

    WorldPoint toWorld(const ScreenPoint& s) const;
    ScreenPoint toScreen(const WorldPoint& w) const;
    CellPoint toCell(const ScreenPoint& s) const;

private:
    double cellSizePx_{interaction_constants::DEFAULT_CELL_SIZE_PX};
    WorldPoint panOffset_{0.0, 0.0};
};

enum class PanDirection : std::uint8_t {
    Up = 0,    // W
    Left = 1,  // A
    Down = 2,  // S
    Right = 3, // D
};

// Turns held WASD keys into per-frame world deltas.
class KeyboardPanController {
public:
    KeyboardPanController() = default;
    explicit KeyboardPanController(const KeyboardPanOptions& options) : options_(options) {}

    void setOptions(const KeyboardPanOptions& options) { options_ = options; }
    const KeyboardPanOptions& options() const noexcept { return options_; }

    void setHeld(PanDirection dir, bool held);
    bool isHeld(PanDirection dir) const { return held_[static_cast<std::size_t>(dir)]; }
    bool anyHeld() const noexcept;
    void releaseAll() noexcept;

    // Advances one frame. Pans by speed * dt for every held direction, and snaps
    // to the cell grid once on the first frame after the last key is released.
    // Returns true when the navigation state changed.
    bool tick(double dtSeconds, NavigationState& nav);

private:
    KeyboardPanOptions options_{};
    std::array<bool, 4> held_{{false, false, false, false}};
    bool wasMoving_{false};
};

#endif // PIXELOID_COORDS_NAVIGATION_STATE_H
