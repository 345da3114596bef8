#pragma once

/**
 * @file interaction_constants.h
 * @brief Centralized constants for the interaction system.
 *
 * This file is the SINGLE SOURCE OF TRUTH for interaction-related defaults.
 * EngineConfig starts from these values; UI layers must not hard-code their own.
 *
 * Rectangle vertex order (engine authority):
 *   0 = Top-Left, 1 = Top-Right, 2 = Bottom-Right, 3 = Bottom-Left
 *
 * Diamond vertex order:
 *   0 = West, 1 = North, 2 = East, 3 = South
 */

#include <cstdint>

namespace interaction_constants {

// =============================================================================
// Pick/Hit-test Tolerances (in screen pixels, converted to world via cell size)
// =============================================================================

/// Tolerance for picking shape bodies and strokes
constexpr double PICK_TOLERANCE_PX = 10.0;

/// Radius of a vertex handle hit area on the selected shape
constexpr double VERTEX_HANDLE_RADIUS_PX = 6.0;

// =============================================================================
// Navigation
// =============================================================================

/// Keyboard pan speed (pixeloids per second)
constexpr double PAN_SPEED_PIXELOIDS_PER_SEC = 50.0;

/// Default size of one cell on screen
constexpr double DEFAULT_CELL_SIZE_PX = 10.0;

/// Smallest accepted cell size
constexpr double MIN_CELL_SIZE_PX = 1e-6;

// =============================================================================
// Drawing
// =============================================================================

/// Number of circumference samples generated for a circle
constexpr std::uint32_t DEFAULT_CIRCLE_SEGMENTS = 8;

/// Opacity the renderer applies to the in-progress preview
constexpr double PREVIEW_OPACITY = 0.7;

/// Minimum pointer travel (pixeloids) before a drag-drawn shape is committed
constexpr double MIN_DRAW_DISTANCE = 0.0;

/// Isometric diamond height as a fraction of its width
constexpr double DIAMOND_ISOMETRIC_RATIO = 0.5;

// =============================================================================
// Vertex index constants (engine authority)
// =============================================================================

namespace RectangleIndex {
    constexpr int TOP_LEFT = 0;
    constexpr int TOP_RIGHT = 1;
    constexpr int BOTTOM_RIGHT = 2;
    constexpr int BOTTOM_LEFT = 3;
}

namespace DiamondIndex {
    constexpr int WEST = 0;
    constexpr int NORTH = 1;
    constexpr int EAST = 2;
    constexpr int SOUTH = 3;
}

} // namespace interaction_constants
