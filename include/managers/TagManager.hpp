/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TAG_MANAGER_HPP
#define TAG_MANAGER_HPP

#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <string>
#include <vector>

// Forward declarations
class Drawable;
class Scene;
namespace PolyForge {
    class ThreadSystem;
}

/**
 * @brief Index of tagged drawables per scene, plus the catalogue of known tags.
 *
 * The index does not own drawables: Drawable::destroy removes each drawable
 * from it before the owning scene lets go. Scenes must be registered with
 * addTaggableEntityList before any other per-scene call; the per-scene calls
 * throw std::out_of_range for an unregistered scene.
 *
 * Not synchronized. Queries may fan out to worker threads, so no drawable or
 * scene may be added or removed while a query is running.
 */
class TagManager {
 public:
  using EntityList = std::vector<Drawable*>;
  using SceneKey = const Scene*;

  TagManager() = default;

  TagManager(const TagManager&) = delete;
  TagManager& operator=(const TagManager&) = delete;

  // Master tag list
  void addTagToMasterList(const std::string& tag);
  bool doesTagExist(const std::string& tag) const;
  void clearTags();
  const std::vector<std::string>& getMasterTagList() const { return m_masterTagList; }

  // Scene registration
  void addTaggableEntityList(const Scene& scene);
  void removeTaggableEntityList(const Scene& scene);
  bool hasTaggableEntityList(const Scene& scene) const;
  size_t getSceneCount() const { return m_entityLists.size(); }

  /**
   * @brief Drawables registered under a scene, in registration order.
   * @throws std::out_of_range if the scene is not registered
   */
  const EntityList& getEntityList(const Scene& scene) const;

  // Per-scene membership; no-op on duplicates and on absent drawables
  void addTaggableEntity(const Scene& scene, Drawable& taggableEntity);
  void removeTaggableEntity(const Scene& scene, const Drawable& taggableEntity);
  void clearEntityList(const Scene& scene);

  /**
   * @brief Drawables in one scene carrying the tag, in registration order.
   * @throws std::out_of_range if the scene is not registered
   */
  std::vector<Drawable*> getAllInListWithTag(const Scene& scene, const std::string& tag) const;

  /**
   * @brief Drawables in every registered scene carrying the tag.
   *
   * Each scene's matches keep their relative order; the order between scenes
   * is unspecified. Scenes are scanned on the attached ThreadSystem when
   * parallel queries are enabled and at least the configured number of
   * scenes is registered, otherwise on the calling thread.
   */
  std::vector<Drawable*> getAllWithTag(const std::string& tag) const;

  /**
   * @brief Attach a worker pool for getAllWithTag.
   *
   * @param threadSystem Pool to use, or nullptr to always scan sequentially.
   *                     Not owned; must outlive the manager or be detached.
   * @param sceneThreshold Minimum registered scene count for a parallel scan
   */
  void setThreadSystem(PolyForge::ThreadSystem* threadSystem, size_t sceneThreshold = 2);
  void setParallelQueriesEnabled(bool enabled) { m_parallelQueries = enabled; }
  bool isParallelQueriesEnabled() const { return m_parallelQueries; }

  /**
   * @brief Clear every scene's list, drop every registration and clear the
   * master tag list.
   */
  void reset();

 private:
  bool shouldScanInParallel() const;

  std::vector<std::string> m_masterTagList;
  boost::container::flat_map<SceneKey, EntityList> m_entityLists;

  PolyForge::ThreadSystem* mp_threadSystem{nullptr};
  size_t m_parallelSceneThreshold{2};
  bool m_parallelQueries{true};
};

#endif  // TAG_MANAGER_HPP
