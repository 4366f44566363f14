/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DRAWABLE_HPP
#define DRAWABLE_HPP

#include "collisions/CollisionPath.hpp"
#include "collisions/CollisionResult.hpp"
#include "entities/Boundary.hpp"
#include "entities/TaggableEntity.hpp"
#include "utils/Transform2D.hpp"
#include "utils/UniqueID.hpp"
#include "utils/Vector2D.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct SDL_Renderer;
class Drawable;
class Behavior;
class Scene;
namespace PolyForge {
    class EngineContext;
}

// Smart pointer type aliases
using DrawablePtr = std::shared_ptr<Drawable>;
using DrawableWeakPtr = std::weak_ptr<Drawable>;
using BehaviorPtr = std::shared_ptr<Behavior>;

// Type alias for drawable ID
using DrawableID = PolyForge::UniqueID::IDType;

/**
 * @brief Abstract base class for every object that can be drawn by a scene.
 *
 * A Drawable carries an immutable identity, a bounding quad, an optional
 * collision path, a render flag, an ordered list of behaviors and a set of
 * tags. Its translation, rotation and scale are not stored here: concrete
 * types derive them from their own geometry and implement the relative
 * transform operations. The absolute setters on this class are written only
 * in terms of those relative operations.
 *
 * Drawables are owned by their scene (through DrawablePtr). The tag manager
 * and the scene's behavior-listener list keep plain pointers, so destroy()
 * must be called before the last owner lets go.
 */
class Drawable : public TaggableEntity, public std::enable_shared_from_this<Drawable> {
 public:
  /**
   * @brief Construct a new Drawable and assign it a unique ID.
   *
   * @param context Engine context providing the error reporter, the tag
   *                manager and the scene-transition state
   */
  explicit Drawable(PolyForge::EngineContext& context);

  ~Drawable() override = default;

  Drawable(const Drawable&) = delete;
  Drawable& operator=(const Drawable&) = delete;

  // Transform state, derived by the concrete type from its geometry
  virtual Vector2D getTranslation() const = 0;
  virtual float getRotation() const = 0;
  virtual Vector2D getScale() const = 0;

  /**
   * @brief Move the drawable by the given offset.
   *
   * Implementations update their geometry, then the boundaries and the
   * collision path. Identity and tags are left untouched.
   */
  virtual void translate(const Vector2D& translationMod) = 0;

  /**
   * @brief Rotate the drawable by rotationMod degrees about centerpoint.
   */
  virtual void rotate(float rotationMod, const Vector2D& centerpoint) = 0;

  /**
   * @brief Change the scale by scaleMod (added to the current scale), keeping
   * centerpoint fixed.
   */
  virtual void scale(const Vector2D& scaleMod, const Vector2D& centerpoint) = 0;

  /**
   * @brief Render in world space.
   *
   * @param renderer SDL renderer from the scene render flow
   * @param cameraX Camera X offset subtracted from world coordinates
   * @param cameraY Camera Y offset subtracted from world coordinates
   */
  virtual void render(SDL_Renderer* renderer, float cameraX, float cameraY) = 0;

  /**
   * @brief Render in screen space, unaffected by the camera.
   */
  virtual void renderAsGUIObject(SDL_Renderer* renderer) = 0;

  /**
   * @brief Release everything the drawable holds and remove every reference
   * to it from originScene and the tag manager.
   *
   * The drawable must not be reused afterwards.
   */
  virtual void destroy(Scene& originScene) = 0;

  // Concrete type name, used in debug ids and log messages
  virtual std::string getName() const = 0;

  // Identity
  DrawableID getID() const { return m_id; }

  /**
   * @brief Human-readable id, "DRAWABLE$<TypeName>_<id>". Built on each call,
   * intended for logging.
   */
  std::string getDebugID() const;

  // Absolute setters, expressed through the relative operations
  void setTranslation(const Vector2D& newTranslation);
  void setRotation(float newRotation);
  void setScale(const Vector2D& newScale);

  // Relative operations about the current centre
  void rotate(float rotationMod);
  void scale(float scaleMod);
  void scale(const Vector2D& scaleMod);

  /**
   * @brief Rotation reduced modulo 360, keeping the sign of the rotation
   * (result lies in (-360, 360)).
   */
  float getRotationWithin360() const;

  /**
   * @brief Composed transform for the renderer: scale, then rotate, then
   * translate.
   */
  PolyForge::Transform2D getTransformation() const;

  bool shouldRender() const { return m_shouldRender; }
  void setShouldRender(bool shouldBeRendered) { m_shouldRender = shouldBeRendered; }

  // Geometry queries
  const std::optional<PolyForge::CollisionPath>& getCollisionPath() const { return m_collisionPath; }
  bool hasCollisionPath() const;
  const std::vector<Vector2D>& getBounds() const { return m_boundaries; }

  /**
   * @brief One corner of the bounding quad.
   * @throws std::out_of_range if the boundaries were never set or were
   *         released by destroy()
   */
  const Vector2D& getBound(Boundary boundary) const;

  // Centroid of the bounding quad
  Vector2D getCenter() const;

  /**
   * @brief Narrow-phase test against another drawable.
   *
   * Pure: reports NoGeometry when either side has no collision path and
   * never logs.
   */
  PolyForge::CollisionResult testCollision(const Drawable& other) const;

  /**
   * @brief Whether the collision paths of both drawables overlap.
   *
   * A missing collision path is reported through the error reporter, unless
   * scenes are switching, and the test degrades to false.
   */
  bool collidesWith(const Drawable& other) const;

  // Behaviors
  const std::vector<BehaviorPtr>& getBehaviors() const { return m_behaviors; }

  /**
   * @brief Call init() on every behavior attached at call time, in order.
   *
   * Iterates over a copy of the list, so behaviors may attach or detach
   * behaviors from inside the hook.
   */
  void initBehaviors();

  /**
   * @brief Call update() on every behavior attached at call time, in order.
   * Same copy semantics as initBehaviors().
   */
  void updateBehaviors();

  // Call destroy() on every behavior, in order
  void destroyAllBehaviors();

  // Empty the behavior list without destroying the behaviors
  void clearAllBehaviors();

  /**
   * @brief Attach a behavior and register as a behavior listener of origin.
   *
   * The same behavior may be attached more than once.
   */
  Drawable& addBehavior(BehaviorPtr behavior, Scene& origin);

  /**
   * @brief Detach one instance of a behavior. When the last behavior goes,
   * the drawable stops listening in originScene.
   */
  Drawable& removeBehavior(const BehaviorPtr& behavior, Scene& originScene);

  // Tags
  /**
   * @brief Tag the drawable, record the tag in the master list and index the
   * drawable under origin.
   */
  Drawable& addTag(const std::string& tag, Scene& origin);

  /**
   * @brief Remove a tag. Once no tags remain, the drawable is dropped from
   * origin's tag index.
   */
  Drawable& removeTag(const std::string& tag, Scene& origin);

  /**
   * @brief Add to the scene's game objects.
   * @throws std::bad_weak_ptr if the drawable is not owned by a DrawablePtr
   */
  Drawable& addAsGameObject(Scene& origin);

  /**
   * @brief Add to the scene's GUI objects.
   * @throws std::bad_weak_ptr if the drawable is not owned by a DrawablePtr
   */
  Drawable& addAsGUIObject(Scene& origin);

  std::string toString() const;

 protected:
  void setCollisionPath(std::optional<PolyForge::CollisionPath> path) { m_collisionPath = std::move(path); }

  /**
   * @brief Replace the bounding quad.
   *
   * Exactly four points are required. Anything else is reported as fatal and
   * the current boundaries are kept.
   */
  void setBounds(std::vector<Vector2D> bounds);

  // Offset every boundary point in place
  void translateBounds(const Vector2D& translation);

  /**
   * @brief Shared teardown for destroy(): removes the drawable from every
   * list in origin and from the tag index, destroys and clears behaviors,
   * clears tags, then releases the collision path and boundaries.
   */
  void destroyTheRest(Scene& origin);

  PolyForge::EngineContext& getContext() const { return m_context; }

  std::optional<PolyForge::CollisionPath> m_collisionPath;

 private:
  PolyForge::EngineContext& m_context;
  const DrawableID m_id;
  bool m_shouldRender{true};
  std::vector<Vector2D> m_boundaries;
  std::vector<BehaviorPtr> m_behaviors;
};

#endif  // DRAWABLE_HPP
