/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Drawable.hpp"
#include "behaviors/Behavior.hpp"
#include "core/EngineContext.hpp"
#include "core/ErrorReporter.hpp"
#include "core/Logger.hpp"
#include "managers/TagManager.hpp"
#include "scenes/Scene.hpp"
#include "utils/Maths.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

Drawable::Drawable(PolyForge::EngineContext& context)
    : m_context(context), m_id(PolyForge::UniqueID::generate()) {}

std::string Drawable::getDebugID() const {
  return std::format("DRAWABLE${}_{}", getName(), m_id);
}

void Drawable::setTranslation(const Vector2D& newTranslation) {
  translate(newTranslation - getTranslation());
}

void Drawable::setRotation(float newRotation) {
  rotate(newRotation - getRotation());
}

void Drawable::setScale(const Vector2D& newScale) {
  scale(newScale - getScale());
}

void Drawable::rotate(float rotationMod) {
  rotate(rotationMod, getCenter());
}

void Drawable::scale(float scaleMod) {
  scale(Vector2D(scaleMod, scaleMod), getCenter());
}

void Drawable::scale(const Vector2D& scaleMod) {
  scale(scaleMod, getCenter());
}

float Drawable::getRotationWithin360() const {
  return std::fmod(getRotation(), 360.0f);
}

PolyForge::Transform2D Drawable::getTransformation() const {
  using PolyForge::Transform2D;

  return Transform2D::translation(getTranslation()) *
         Transform2D::rotation(getRotation()) *
         Transform2D::scaling(getScale());
}

bool Drawable::hasCollisionPath() const {
  return m_collisionPath.has_value();
}

const Vector2D& Drawable::getBound(Boundary boundary) const {
  return m_boundaries.at(static_cast<size_t>(boundary));
}

Vector2D Drawable::getCenter() const {
  return PolyForge::Maths::centerOf(m_boundaries);
}

PolyForge::CollisionResult Drawable::testCollision(const Drawable& other) const {
  using PolyForge::CollisionResult;

  if (!hasCollisionPath() || !other.hasCollisionPath()) {
    return CollisionResult::NoGeometry;
  }

  return m_collisionPath->intersects(*other.m_collisionPath)
             ? CollisionResult::Intersects
             : CollisionResult::NoIntersection;
}

bool Drawable::collidesWith(const Drawable& other) const {
  using PolyForge::CollisionResult;

  const CollisionResult result = testCollision(other);
  if (result != CollisionResult::NoGeometry) {
    return result == CollisionResult::Intersects;
  }

  const bool switchingScenes = m_context.isSwitchingScenes();
  const Drawable& missing = other.hasCollisionPath() ? *this : other;

  if (PolyForge::shouldReportMissingGeometry(false, switchingScenes)) {
    m_context.getErrorReporter().error(
        std::format("Couldn't check for collision between {} and {}",
                    getDebugID(), other.getDebugID()),
        std::format("{} has no collision path", missing.getDebugID()));
  } else {
    COLLISION_DEBUG(std::format("Skipped collision check for {}: scene switch in progress",
                                missing.getDebugID()));
  }
  return false;
}

void Drawable::initBehaviors() {
  // Hooks may attach or detach behaviors, or destroy this drawable
  const DrawablePtr self = weak_from_this().lock();
  const std::vector<BehaviorPtr> snapshot = m_behaviors;
  for (const auto& behavior : snapshot) {
    behavior->init(*this);
  }
}

void Drawable::updateBehaviors() {
  const DrawablePtr self = weak_from_this().lock();
  const std::vector<BehaviorPtr> snapshot = m_behaviors;
  for (const auto& behavior : snapshot) {
    behavior->update(*this);
  }
}

void Drawable::destroyAllBehaviors() {
  for (const auto& behavior : m_behaviors) {
    behavior->destroy();
  }
}

void Drawable::clearAllBehaviors() {
  m_behaviors.clear();
}

Drawable& Drawable::addBehavior(BehaviorPtr behavior, Scene& origin) {
  if (!behavior) {
    BEHAVIOR_WARN(std::format("Ignoring null behavior added to {}", getDebugID()));
    return *this;
  }

  m_behaviors.push_back(std::move(behavior));
  origin.addBehaviorListener(*this);
  return *this;
}

Drawable& Drawable::removeBehavior(const BehaviorPtr& behavior, Scene& originScene) {
  auto it = std::find(m_behaviors.begin(), m_behaviors.end(), behavior);
  if (it != m_behaviors.end()) {
    m_behaviors.erase(it);
  }

  if (m_behaviors.empty()) {
    originScene.removeBehaviorListener(*this);
  }
  return *this;
}

Drawable& Drawable::addTag(const std::string& tag, Scene& origin) {
  insertTag(tag);

  TagManager& tagManager = m_context.getTagManager();
  tagManager.addTagToMasterList(tag);
  tagManager.addTaggableEntity(origin, *this);
  return *this;
}

Drawable& Drawable::removeTag(const std::string& tag, Scene& origin) {
  eraseTag(tag);

  if (getTags().empty()) {
    m_context.getTagManager().removeTaggableEntity(origin, *this);
  }
  return *this;
}

Drawable& Drawable::addAsGameObject(Scene& origin) {
  origin.addGameObject(shared_from_this());
  return *this;
}

Drawable& Drawable::addAsGUIObject(Scene& origin) {
  origin.addGUIObject(shared_from_this());
  return *this;
}

std::string Drawable::toString() const {
  std::string boundsText;
  for (const auto& bound : m_boundaries) {
    if (!boundsText.empty()) {
      boundsText += ", ";
    }
    boundsText += bound.toString();
  }

  return std::format(
      "{}{{translation: {}, rotation: {}, scale: {}, bounds: [{}], "
      "collisionPath: {}, behaviors: {}, tags: {}, shouldRender: {}}}",
      getName(), getTranslation().toString(), getRotation(), getScale().toString(),
      boundsText, hasCollisionPath(), m_behaviors.size(), getTags().size(),
      m_shouldRender);
}

void Drawable::setBounds(std::vector<Vector2D> bounds) {
  if (bounds.size() != BOUNDARY_COUNT) {
    m_context.getErrorReporter().fatal(
        std::format("Tried to set the bounds of {}", getDebugID()),
        std::format("The bounds must have {} points, but {} were given",
                    BOUNDARY_COUNT, bounds.size()));
    return;
  }

  m_boundaries = std::move(bounds);
}

void Drawable::translateBounds(const Vector2D& translation) {
  for (auto& bound : m_boundaries) {
    bound += translation;
  }
}

void Drawable::destroyTheRest(Scene& origin) {
  // Scene lists may hold the last owning reference
  DrawablePtr self = weak_from_this().lock();

  origin.removeGameObject(*this);
  origin.removeGUIObject(*this);
  origin.removeBehaviorListener(*this);
  origin.removeTaggableEntity(*this);

  destroyAllBehaviors();
  clearAllBehaviors();
  clearTags();

  if (m_collisionPath.has_value()) {
    m_collisionPath->reset();
    m_collisionPath.reset();
  }
  m_boundaries.clear();

  DRAWABLE_DEBUG(std::format("Destroyed {}", getDebugID()));
}
