/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESULT_HPP
#define COLLISION_RESULT_HPP

#include <cstdint>
#include <ostream>

namespace PolyForge {

// Outcome of a narrow-phase test between two drawables
enum class CollisionResult : uint8_t {
  NoGeometry = 0,     // at least one side has no collision path
  NoIntersection = 1,
  Intersects = 2
};

/**
 * @brief Whether a missing collision path should be reported as an error.
 *
 * A missing path is expected while scenes are switching (drawables are being
 * torn down), so it is only reported outside of a transition.
 */
inline bool shouldReportMissingGeometry(bool hasPath, bool isSwitchingScenes) {
  return !hasPath && !isSwitchingScenes;
}

// Stream operator for CollisionResult (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, CollisionResult result) {
  switch (result) {
  case CollisionResult::NoGeometry:
    return os << "NoGeometry";
  case CollisionResult::NoIntersection:
    return os << "NoIntersection";
  case CollisionResult::Intersects:
    return os << "Intersects";
  }
  return os << "Unknown";
}

} // namespace PolyForge

#endif // COLLISION_RESULT_HPP
