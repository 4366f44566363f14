/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCENE_HPP
#define SCENE_HPP

#include "entities/Drawable.hpp"
#include <string>
#include <vector>

// Forward declarations
struct SDL_Renderer;
namespace PolyForge {
    class EngineContext;
}

/**
 * @brief Owner of a set of drawables, loaded and unloaded by the SceneManager.
 *
 * A scene keeps two owning lists (game objects, drawn in world space, and GUI
 * objects, drawn in screen space) and one non-owning list of drawables that
 * carry behaviors. Every list is de-duplicated and keeps insertion order.
 */
class Scene {
 public:
  Scene(const std::string& sceneName, PolyForge::EngineContext& context);
  virtual ~Scene() = default;

  Scene(const Scene&) = delete;
  Scene& operator=(const Scene&) = delete;

  virtual void load() = 0;
  virtual void unload() = 0;
  virtual void update(float deltaTime) = 0;

  const std::string& getSceneName() const { return m_sceneName; }

  bool isInitialized() const { return m_initialized; }
  void setInitialized(bool initialized) { m_initialized = initialized; }

  // Object lists
  const std::vector<DrawablePtr>& getGameObjects() const { return m_gameObjects; }
  const std::vector<DrawablePtr>& getGUIObjects() const { return m_guiObjects; }
  const std::vector<Drawable*>& getBehaviorListeners() const { return m_behaviorListeners; }

  void addGameObject(DrawablePtr gameObject);
  void removeGameObject(const Drawable& gameObject);
  void addGUIObject(DrawablePtr guiObject);
  void removeGUIObject(const Drawable& guiObject);

  // Behavior listeners are not owned; see Drawable::destroy
  void addBehaviorListener(Drawable& listener);
  void removeBehaviorListener(const Drawable& listener);
  bool hasBehaviorListener(const Drawable& listener) const;

  // Drop the drawable from this scene's tag index
  void removeTaggableEntity(Drawable& taggableEntity);

  /**
   * @brief Initialize the behaviors of every listener present at call time.
   */
  void initBehaviorListeners();

  /**
   * @brief Update the behaviors of every listener present at call time.
   */
  void updateBehaviorListeners();

  /**
   * @brief Draw game objects relative to the camera, then GUI objects on top.
   * Drawables with rendering turned off are skipped.
   */
  void render(SDL_Renderer* renderer, float cameraX = 0.0f, float cameraY = 0.0f);

  // Forget every object without destroying it
  void clearAllLists();

  /**
   * @brief Destroy every owned drawable, then clear all lists.
   */
  void destroyAllLists();

 protected:
  PolyForge::EngineContext& getContext() const { return m_context; }

 private:
  // Listeners destroyed or detached by an earlier hook in the same pass are skipped
  void notifyBehaviorListeners(void (Drawable::*hook)());

  std::string m_sceneName;
  PolyForge::EngineContext& m_context;
  bool m_initialized{false};

  std::vector<DrawablePtr> m_gameObjects;
  std::vector<DrawablePtr> m_guiObjects;
  std::vector<Drawable*> m_behaviorListeners;
};

#endif  // SCENE_HPP
