/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef POLYGON_2D_HPP
#define POLYGON_2D_HPP

#include "entities/Drawable.hpp"
#include <SDL3/SDL_pixels.h>
#include <string>
#include <vector>

/**
 * @brief Outline polygon drawable.
 *
 * Keeps its outline in model space together with a translation, a rotation
 * in degrees and a per-axis scale. World geometry is
 * translate * rotate * scale applied to the model points; the boundaries are
 * the model bounding box carried through the same transform, so they rotate
 * with the shape.
 */
class Polygon2D : public Drawable {
 public:
  /**
   * @brief Create a polygon whose outline starts at the given world points.
   *
   * @param context Engine context
   * @param points Outline vertices in order, at least three
   * @param color Outline colour
   * @throws std::invalid_argument if fewer than three points are given
   */
  Polygon2D(PolyForge::EngineContext& context, std::vector<Vector2D> points,
            SDL_Color color = SDL_Color{255, 255, 255, 255});

  // Bring the pivot-less overloads back into scope
  using Drawable::rotate;
  using Drawable::scale;

  Vector2D getTranslation() const override { return m_translation; }
  float getRotation() const override { return m_rotation; }
  Vector2D getScale() const override { return m_scale; }

  void translate(const Vector2D& translationMod) override;
  void rotate(float rotationMod, const Vector2D& centerpoint) override;
  void scale(const Vector2D& scaleMod, const Vector2D& centerpoint) override;

  void render(SDL_Renderer* renderer, float cameraX, float cameraY) override;
  void renderAsGUIObject(SDL_Renderer* renderer) override;

  void destroy(Scene& originScene) override;

  std::string getName() const override { return "Polygon2D"; }

  // Outline in world space, in construction order
  const std::vector<Vector2D>& getPoints() const { return m_worldPoints; }
  const std::vector<Vector2D>& getModelPoints() const { return m_modelPoints; }

  SDL_Color getColor() const { return m_color; }
  void setColor(SDL_Color color) { m_color = color; }

 private:
  // Recompute world points, boundaries and collision path from the transform
  void rebuildGeometry();
  void drawOutline(SDL_Renderer* renderer, float offsetX, float offsetY) const;

  std::vector<Vector2D> m_modelPoints;
  std::vector<Vector2D> m_worldPoints;
  Vector2D m_translation{0.0f, 0.0f};
  float m_rotation{0.0f};
  Vector2D m_scale{1.0f, 1.0f};
  SDL_Color m_color;
};

#endif  // POLYGON_2D_HPP
