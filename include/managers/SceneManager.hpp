/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCENE_MANAGER_HPP
#define SCENE_MANAGER_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include "scenes/Scene.hpp"

// Forward declarations
struct SDL_Renderer;
class TagManager;

/**
 * @brief Registry of named scenes with a single current scene.
 *
 * Registering a scene also registers its tag list with the TagManager;
 * removing it drops that list again.
 */
class SceneManager {

 public:
  explicit SceneManager(TagManager& tagManager);

  /**
   * @throws std::runtime_error if a scene with the same name is registered
   */
  void addScene(std::shared_ptr<Scene> scene);
  void removeScene(const std::string& sceneName);
  void clearAllScenes();

  bool hasScene(const std::string& sceneName) const;
  std::shared_ptr<Scene> getScene(const std::string& sceneName) const;
  size_t getSceneCount() const { return m_scenes.size(); }

  /**
   * @brief Make a registered scene current without loading it.
   * @return false if no scene with that name is registered
   */
  bool setCurrentScene(const std::string& sceneName);
  std::shared_ptr<Scene> getCurrentScene() const { return m_currentScene; }

  // Load the current scene and initialize its behavior listeners
  void loadCurrentScene();

  /**
   * @brief Unload the current scene and load the named one.
   *
   * isSwitchingScenes() reports true from the start of the unload until the
   * new scene has loaded and initialized its behaviors.
   *
   * @return false if no scene with that name is registered
   */
  bool switchScenes(const std::string& nextSceneName);

  // Update the current scene, then its behavior listeners
  void update(float deltaTime);
  void render(SDL_Renderer* renderer, float cameraX = 0.0f, float cameraY = 0.0f);

  bool isSwitchingScenes() const { return m_switchingScenes; }

 private:
  TagManager& m_tagManager;
  std::unordered_map<std::string, std::shared_ptr<Scene>> m_scenes;
  std::shared_ptr<Scene> m_currentScene;
  bool m_switchingScenes{false};
};

#endif  // SCENE_MANAGER_HPP
