/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Polygon2D.hpp"
#include "core/Logger.hpp"
#include "utils/Maths.hpp"
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_rect.h>
#include <SDL3/SDL_render.h>
#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace {

// Ratio of new to old scale on one axis; a collapsed axis keeps its offset
float scaleRatio(float newScale, float oldScale) {
  if (PolyForge::Maths::floatEquals(oldScale, 0.0f)) {
    return 1.0f;
  }
  return newScale / oldScale;
}

}  // anonymous namespace

Polygon2D::Polygon2D(PolyForge::EngineContext& context, std::vector<Vector2D> points,
                     SDL_Color color)
    : Drawable(context), m_modelPoints(std::move(points)), m_color(color) {
  if (m_modelPoints.size() < 3) {
    throw std::invalid_argument(std::format(
        "PolyForge Engine - Polygon2D needs at least 3 points, got {}", m_modelPoints.size()));
  }
  rebuildGeometry();
}

void Polygon2D::translate(const Vector2D& translationMod) {
  m_translation += translationMod;
  for (auto& point : m_worldPoints) {
    point += translationMod;
  }

  translateBounds(translationMod);
  if (m_collisionPath.has_value()) {
    m_collisionPath->translate(translationMod);
  }
}

void Polygon2D::rotate(float rotationMod, const Vector2D& centerpoint) {
  using PolyForge::Transform2D;

  // Orbit the origin around the pivot, then turn the shape by the same amount
  m_translation = centerpoint + Transform2D::rotation(rotationMod).applyDirection(m_translation - centerpoint);
  m_rotation += rotationMod;
  rebuildGeometry();
}

void Polygon2D::scale(const Vector2D& scaleMod, const Vector2D& centerpoint) {
  using PolyForge::Transform2D;

  const Vector2D newScale = m_scale + scaleMod;

  // The pivot offset is scaled along the shape's own axes
  Vector2D offset = Transform2D::rotation(-m_rotation).applyDirection(m_translation - centerpoint);
  offset = offset.multiply(Vector2D(scaleRatio(newScale.getX(), m_scale.getX()),
                                    scaleRatio(newScale.getY(), m_scale.getY())));
  m_translation = centerpoint + Transform2D::rotation(m_rotation).applyDirection(offset);

  m_scale = newScale;
  rebuildGeometry();
}

void Polygon2D::render(SDL_Renderer* renderer, float cameraX, float cameraY) {
  drawOutline(renderer, -cameraX, -cameraY);
}

void Polygon2D::renderAsGUIObject(SDL_Renderer* renderer) {
  drawOutline(renderer, 0.0f, 0.0f);
}

void Polygon2D::destroy(Scene& originScene) {
  m_modelPoints.clear();
  m_worldPoints.clear();
  destroyTheRest(originScene);
}

void Polygon2D::rebuildGeometry() {
  if (m_modelPoints.empty()) {
    return;  // destroyed
  }

  const PolyForge::Transform2D transformation = getTransformation();

  m_worldPoints.clear();
  m_worldPoints.reserve(m_modelPoints.size());
  for (const auto& point : m_modelPoints) {
    m_worldPoints.push_back(transformation.apply(point));
  }

  auto [minX, maxX] = std::minmax_element(
      m_modelPoints.begin(), m_modelPoints.end(),
      [](const Vector2D& a, const Vector2D& b) { return a.getX() < b.getX(); });
  auto [minY, maxY] = std::minmax_element(
      m_modelPoints.begin(), m_modelPoints.end(),
      [](const Vector2D& a, const Vector2D& b) { return a.getY() < b.getY(); });

  setBounds({
      transformation.apply(Vector2D(minX->getX(), minY->getY())),
      transformation.apply(Vector2D(maxX->getX(), minY->getY())),
      transformation.apply(Vector2D(maxX->getX(), maxY->getY())),
      transformation.apply(Vector2D(minX->getX(), maxY->getY())),
  });

  setCollisionPath(PolyForge::CollisionPath(m_worldPoints));
}

void Polygon2D::drawOutline(SDL_Renderer* renderer, float offsetX, float offsetY) const {
  if (renderer == nullptr || m_worldPoints.empty()) {
    return;
  }

  // Closed loop: repeat the first vertex at the end
  std::vector<SDL_FPoint> linePoints;
  linePoints.reserve(m_worldPoints.size() + 1);
  for (const auto& point : m_worldPoints) {
    linePoints.push_back(SDL_FPoint{point.getX() + offsetX, point.getY() + offsetY});
  }
  linePoints.push_back(linePoints.front());

  SDL_SetRenderDrawColor(renderer, m_color.r, m_color.g, m_color.b, m_color.a);
  if (!SDL_RenderLines(renderer, linePoints.data(), static_cast<int>(linePoints.size()))) {
    DRAWABLE_ERROR(std::format("Failed to render {}: {}", getDebugID(), SDL_GetError()));
  }
}
