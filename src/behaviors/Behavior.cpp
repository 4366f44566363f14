/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "behaviors/Behavior.hpp"
#include "core/Logger.hpp"
#include "entities/Drawable.hpp"
#include <format>

namespace {

class SimpleTranslationBehavior : public Behavior {
public:
  explicit SimpleTranslationBehavior(const Vector2D &translationMod)
      : m_translationMod(translationMod) {}

  void init(Drawable &drawable) override {
    BEHAVIOR_DEBUG(std::format("{} attached to {}", getName(), drawable.getDebugID()));
  }

  void update(Drawable &drawable) override { drawable.translate(m_translationMod); }

  void destroy() override {}

  std::string getName() const override { return "SimpleTranslation"; }

private:
  Vector2D m_translationMod;
};

class SimpleRotationBehavior : public Behavior {
public:
  explicit SimpleRotationBehavior(float rotationMod) : m_rotationMod(rotationMod) {}

  void init(Drawable &drawable) override {
    BEHAVIOR_DEBUG(std::format("{} attached to {}", getName(), drawable.getDebugID()));
  }

  void update(Drawable &drawable) override { drawable.rotate(m_rotationMod); }

  void destroy() override {}

  std::string getName() const override { return "SimpleRotation"; }

private:
  float m_rotationMod;
};

class SimpleScaleBehavior : public Behavior {
public:
  explicit SimpleScaleBehavior(const Vector2D &scaleMod) : m_scaleMod(scaleMod) {}

  void init(Drawable &drawable) override {
    BEHAVIOR_DEBUG(std::format("{} attached to {}", getName(), drawable.getDebugID()));
  }

  void update(Drawable &drawable) override { drawable.scale(m_scaleMod); }

  void destroy() override {}

  std::string getName() const override { return "SimpleScale"; }

private:
  Vector2D m_scaleMod;
};

} // anonymous namespace

std::shared_ptr<Behavior> Behavior::simpleTranslation(const Vector2D &translationMod) {
  return std::make_shared<SimpleTranslationBehavior>(translationMod);
}

std::shared_ptr<Behavior> Behavior::simpleRotation(float rotationMod) {
  return std::make_shared<SimpleRotationBehavior>(rotationMod);
}

std::shared_ptr<Behavior> Behavior::simpleScale(const Vector2D &scaleMod) {
  return std::make_shared<SimpleScaleBehavior>(scaleMod);
}
