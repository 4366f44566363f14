/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SceneManager.hpp"
#include "core/Logger.hpp"
#include "managers/TagManager.hpp"
#include <stdexcept>

namespace {

// Clears the switching flag even if a scene throws while loading
class SwitchGuard {
 public:
  explicit SwitchGuard(bool& flag) : m_flag(flag) { m_flag = true; }
  ~SwitchGuard() { m_flag = false; }

  SwitchGuard(const SwitchGuard&) = delete;
  SwitchGuard& operator=(const SwitchGuard&) = delete;

 private:
  bool& m_flag;
};

}  // anonymous namespace

SceneManager::SceneManager(TagManager& tagManager) : m_tagManager(tagManager) {
  m_scenes.reserve(8);
}

void SceneManager::addScene(std::shared_ptr<Scene> scene) {
  if (!scene) {
    SCENE_WARN("Ignoring null scene");
    return;
  }

  const std::string name = scene->getSceneName();
  if (hasScene(name)) {
    SCENE_ERROR("Scene with name " + name + " already exists");
    throw std::runtime_error("PolyForge Engine - Scene with name " + name +
                             " already exists");
  }

  m_tagManager.addTaggableEntityList(*scene);
  m_scenes[name] = std::move(scene);
  SCENE_DEBUG("Added scene: " + name);
}

void SceneManager::removeScene(const std::string& sceneName) {
  auto it = m_scenes.find(sceneName);
  if (it == m_scenes.end()) {
    SCENE_WARN("Scene not found: " + sceneName);
    return;
  }

  if (m_currentScene == it->second) {
    if (m_currentScene->isInitialized()) {
      m_currentScene->unload();
      m_currentScene->setInitialized(false);
    }
    m_currentScene.reset();
  }

  m_tagManager.removeTaggableEntityList(*it->second);
  m_scenes.erase(it);
  SCENE_DEBUG("Removed scene: " + sceneName);
}

void SceneManager::clearAllScenes() {
  if (m_currentScene && m_currentScene->isInitialized()) {
    m_currentScene->unload();
    m_currentScene->setInitialized(false);
  }
  m_currentScene.reset();

  for (const auto& [name, scene] : m_scenes) {
    m_tagManager.removeTaggableEntityList(*scene);
  }
  m_scenes.clear();
}

bool SceneManager::hasScene(const std::string& sceneName) const {
  return m_scenes.find(sceneName) != m_scenes.end();
}

std::shared_ptr<Scene> SceneManager::getScene(const std::string& sceneName) const {
  auto it = m_scenes.find(sceneName);
  return it != m_scenes.end() ? it->second : nullptr;
}

bool SceneManager::setCurrentScene(const std::string& sceneName) {
  auto scene = getScene(sceneName);
  if (!scene) {
    SCENE_ERROR("Scene not found: " + sceneName);
    return false;
  }

  m_currentScene = std::move(scene);
  return true;
}

void SceneManager::loadCurrentScene() {
  if (!m_currentScene) {
    SCENE_WARN("No current scene to load");
    return;
  }
  if (m_currentScene->isInitialized()) {
    return;
  }

  m_currentScene->load();
  m_currentScene->setInitialized(true);
  m_currentScene->initBehaviorListeners();
  SCENE_INFO("Loaded scene: " + m_currentScene->getSceneName());
}

bool SceneManager::switchScenes(const std::string& nextSceneName) {
  auto nextScene = getScene(nextSceneName);
  if (!nextScene) {
    SCENE_ERROR("Cannot switch to unknown scene: " + nextSceneName);
    return false;
  }

  SwitchGuard guard(m_switchingScenes);

  if (m_currentScene && m_currentScene->isInitialized()) {
    m_currentScene->unload();
    m_currentScene->setInitialized(false);
  }

  m_currentScene = std::move(nextScene);
  loadCurrentScene();
  return true;
}

void SceneManager::update(float deltaTime) {
  if (!m_currentScene || !m_currentScene->isInitialized()) {
    return;
  }

  m_currentScene->update(deltaTime);
  m_currentScene->updateBehaviorListeners();
}

void SceneManager::render(SDL_Renderer* renderer, float cameraX, float cameraY) {
  if (m_currentScene && m_currentScene->isInitialized()) {
    m_currentScene->render(renderer, cameraX, cameraY);
  }
}
