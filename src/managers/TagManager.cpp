/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/TagManager.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "entities/Drawable.hpp"
#include "scenes/Scene.hpp"
#include <algorithm>
#include <format>
#include <future>

namespace {

std::vector<Drawable*> filterByTag(const TagManager::EntityList& entityList,
                                   const std::string& tag) {
  std::vector<Drawable*> matches;
  for (Drawable* entity : entityList) {
    if (entity->hasTag(tag)) {
      matches.push_back(entity);
    }
  }
  return matches;
}

}  // anonymous namespace

void TagManager::addTagToMasterList(const std::string& tag) {
  if (!doesTagExist(tag)) {
    m_masterTagList.push_back(tag);
  }
}

bool TagManager::doesTagExist(const std::string& tag) const {
  return std::find(m_masterTagList.begin(), m_masterTagList.end(), tag) !=
         m_masterTagList.end();
}

void TagManager::clearTags() {
  m_masterTagList.clear();
}

void TagManager::addTaggableEntityList(const Scene& scene) {
  if (m_entityLists.emplace(&scene, EntityList{}).second) {
    TAG_DEBUG(std::format("Registered tag list for scene {}", scene.getSceneName()));
  }
}

void TagManager::removeTaggableEntityList(const Scene& scene) {
  m_entityLists.erase(&scene);
}

bool TagManager::hasTaggableEntityList(const Scene& scene) const {
  return m_entityLists.find(&scene) != m_entityLists.end();
}

const TagManager::EntityList& TagManager::getEntityList(const Scene& scene) const {
  return m_entityLists.at(&scene);
}

void TagManager::addTaggableEntity(const Scene& scene, Drawable& taggableEntity) {
  EntityList& entityList = m_entityLists.at(&scene);
  if (std::find(entityList.begin(), entityList.end(), &taggableEntity) == entityList.end()) {
    entityList.push_back(&taggableEntity);
  }
}

void TagManager::removeTaggableEntity(const Scene& scene, const Drawable& taggableEntity) {
  EntityList& entityList = m_entityLists.at(&scene);
  entityList.erase(std::remove(entityList.begin(), entityList.end(), &taggableEntity),
                   entityList.end());
}

void TagManager::clearEntityList(const Scene& scene) {
  m_entityLists.at(&scene).clear();
}

std::vector<Drawable*> TagManager::getAllInListWithTag(const Scene& scene,
                                                       const std::string& tag) const {
  return filterByTag(m_entityLists.at(&scene), tag);
}

std::vector<Drawable*> TagManager::getAllWithTag(const std::string& tag) const {
  std::vector<Drawable*> matches;

  if (!shouldScanInParallel()) {
    for (const auto& [scene, entityList] : m_entityLists) {
      std::vector<Drawable*> sceneMatches = filterByTag(entityList, tag);
      matches.insert(matches.end(), sceneMatches.begin(), sceneMatches.end());
    }
    return matches;
  }

  // One task per scene; the lists stay untouched until every future is joined
  std::vector<std::future<std::vector<Drawable*>>> futures;
  futures.reserve(m_entityLists.size());
  for (const auto& [scene, entityList] : m_entityLists) {
    const EntityList* list = &entityList;
    futures.push_back(mp_threadSystem->enqueueTaskWithResult(
        [list, tag]() { return filterByTag(*list, tag); },
        std::format("TagQuery_{}", scene->getSceneName())));
  }

  for (auto& future : futures) {
    std::vector<Drawable*> sceneMatches = future.get();
    matches.insert(matches.end(), sceneMatches.begin(), sceneMatches.end());
  }
  return matches;
}

void TagManager::setThreadSystem(PolyForge::ThreadSystem* threadSystem, size_t sceneThreshold) {
  mp_threadSystem = threadSystem;
  m_parallelSceneThreshold = std::max<size_t>(sceneThreshold, 1);
}

void TagManager::reset() {
  for (auto& [scene, entityList] : m_entityLists) {
    entityList.clear();
  }
  m_entityLists.clear();
  clearTags();
  TAG_DEBUG("TagManager reset");
}

bool TagManager::shouldScanInParallel() const {
  return m_parallelQueries && mp_threadSystem != nullptr &&
         !mp_threadSystem->isShutdown() && mp_threadSystem->getThreadCount() > 0 &&
         m_entityLists.size() >= m_parallelSceneThreshold;
}
