/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_HPP
#define BEHAVIOR_HPP

#include "utils/Vector2D.hpp"
#include <memory>
#include <string>

class Drawable;

/**
 * @brief Script attached to a drawable.
 *
 * A behavior instance may be attached to several drawables (or to the same
 * drawable more than once), so per-drawable state belongs on the drawable,
 * not here. Hooks run on the frame thread.
 */
class Behavior {
public:
  virtual ~Behavior() = default;

  // Called once when the owning scene initializes its behavior listeners
  virtual void init(Drawable &drawable) = 0;

  // Called every scene update for each drawable carrying this behavior
  virtual void update(Drawable &drawable) = 0;

  // Release anything the behavior holds; called from Drawable::destroy
  virtual void destroy() = 0;

  virtual std::string getName() const = 0;

  // =========================================================================
  // BUILT-IN BEHAVIORS
  // =========================================================================

  /**
   * @brief Moves the drawable by a fixed offset every update.
   */
  static std::shared_ptr<Behavior> simpleTranslation(const Vector2D &translationMod);

  /**
   * @brief Rotates the drawable about its centre by a fixed number of degrees
   * every update.
   */
  static std::shared_ptr<Behavior> simpleRotation(float rotationMod);

  /**
   * @brief Grows the drawable about its centre by a fixed scale delta every
   * update.
   */
  static std::shared_ptr<Behavior> simpleScale(const Vector2D &scaleMod);
};

#endif // BEHAVIOR_HPP
