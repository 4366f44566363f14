/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "scenes/Scene.hpp"
#include "core/EngineContext.hpp"
#include "core/Logger.hpp"
#include "managers/TagManager.hpp"
#include <algorithm>
#include <format>

namespace {

bool containsDrawable(const std::vector<DrawablePtr>& list, const Drawable& drawable) {
  return std::any_of(list.begin(), list.end(),
                     [&](const DrawablePtr& entry) { return entry.get() == &drawable; });
}

void eraseDrawable(std::vector<DrawablePtr>& list, const Drawable& drawable) {
  list.erase(std::remove_if(list.begin(), list.end(),
                            [&](const DrawablePtr& entry) { return entry.get() == &drawable; }),
             list.end());
}

}  // anonymous namespace

Scene::Scene(const std::string& sceneName, PolyForge::EngineContext& context)
    : m_sceneName(sceneName), m_context(context) {
  m_gameObjects.reserve(32);
  m_behaviorListeners.reserve(32);
}

void Scene::addGameObject(DrawablePtr gameObject) {
  if (!gameObject || containsDrawable(m_gameObjects, *gameObject)) {
    return;
  }
  m_gameObjects.push_back(std::move(gameObject));
}

void Scene::removeGameObject(const Drawable& gameObject) {
  eraseDrawable(m_gameObjects, gameObject);
}

void Scene::addGUIObject(DrawablePtr guiObject) {
  if (!guiObject || containsDrawable(m_guiObjects, *guiObject)) {
    return;
  }
  m_guiObjects.push_back(std::move(guiObject));
}

void Scene::removeGUIObject(const Drawable& guiObject) {
  eraseDrawable(m_guiObjects, guiObject);
}

void Scene::addBehaviorListener(Drawable& listener) {
  if (!hasBehaviorListener(listener)) {
    m_behaviorListeners.push_back(&listener);
  }
}

void Scene::removeBehaviorListener(const Drawable& listener) {
  m_behaviorListeners.erase(
      std::remove(m_behaviorListeners.begin(), m_behaviorListeners.end(), &listener),
      m_behaviorListeners.end());
}

bool Scene::hasBehaviorListener(const Drawable& listener) const {
  return std::find(m_behaviorListeners.begin(), m_behaviorListeners.end(), &listener) !=
         m_behaviorListeners.end();
}

void Scene::removeTaggableEntity(Drawable& taggableEntity) {
  m_context.getTagManager().removeTaggableEntity(*this, taggableEntity);
}

void Scene::initBehaviorListeners() {
  notifyBehaviorListeners(&Drawable::initBehaviors);
}

void Scene::updateBehaviorListeners() {
  notifyBehaviorListeners(&Drawable::updateBehaviors);
}

void Scene::notifyBehaviorListeners(void (Drawable::*hook)()) {
  // A hook may destroy any listener, including the last owner of another one
  struct ListenerEntry {
    Drawable* listener;
    DrawableWeakPtr owner;
    bool shared;
  };

  std::vector<ListenerEntry> snapshot;
  snapshot.reserve(m_behaviorListeners.size());
  for (Drawable* listener : m_behaviorListeners) {
    DrawableWeakPtr owner = listener->weak_from_this();
    const bool shared = !owner.expired();
    snapshot.push_back({listener, std::move(owner), shared});
  }

  for (const auto& entry : snapshot) {
    const DrawablePtr keepAlive = entry.owner.lock();
    if (entry.shared && !keepAlive) {
      continue;  // freed by an earlier hook
    }
    if (std::find(m_behaviorListeners.begin(), m_behaviorListeners.end(), entry.listener) ==
        m_behaviorListeners.end()) {
      continue;  // destroyed or detached by an earlier hook
    }
    (entry.listener->*hook)();
  }
}

void Scene::render(SDL_Renderer* renderer, float cameraX, float cameraY) {
  for (const auto& gameObject : m_gameObjects) {
    if (gameObject->shouldRender()) {
      gameObject->render(renderer, cameraX, cameraY);
    }
  }

  for (const auto& guiObject : m_guiObjects) {
    if (guiObject->shouldRender()) {
      guiObject->renderAsGUIObject(renderer);
    }
  }
}

void Scene::clearAllLists() {
  m_gameObjects.clear();
  m_guiObjects.clear();
  m_behaviorListeners.clear();
}

void Scene::destroyAllLists() {
  // destroy() removes each drawable from the lists being walked
  const std::vector<DrawablePtr> gameObjects = m_gameObjects;
  for (const auto& gameObject : gameObjects) {
    gameObject->destroy(*this);
  }

  const std::vector<DrawablePtr> guiObjects = m_guiObjects;
  for (const auto& guiObject : guiObjects) {
    guiObject->destroy(*this);
  }

  SCENE_DEBUG(std::format("Destroyed {} objects in scene {}",
                          gameObjects.size() + guiObjects.size(), m_sceneName));
  clearAllLists();
}
