/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENGINE_CONTEXT_HPP
#define ENGINE_CONTEXT_HPP

#include "core/ErrorReporter.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/SceneManager.hpp"
#include "managers/SettingsManager.hpp"
#include "managers/TagManager.hpp"
#include <memory>
#include <string>

namespace PolyForge {

/**
 * @brief Owns the engine-wide services a drawable or scene reaches for.
 *
 * One context per engine instance; tests create as many as they need.
 * Drawables and scenes hold a reference to it, so the context must outlive
 * every drawable and scene created against it.
 *
 * Usage:
 *   PolyForge::EngineContext context;
 *   context.init("res/settings.json");
 *   context.getSceneManager().addScene(std::make_shared<GameScene>(context));
 *   ...
 *   context.clean();
 */
class EngineContext {
public:
  EngineContext();
  ~EngineContext();

  /**
   * @brief Load settings (when settingsPath is not empty) and apply them.
   *
   * A missing or malformed settings file is logged and the defaults are
   * used.
   *
   * @return false if the worker pool could not be started
   */
  bool init(const std::string &settingsPath = "");

  /**
   * @brief Apply the current settings: benchmark logging, and starting,
   * stopping or reconfiguring the tag query worker pool.
   */
  bool applySettings();

  /**
   * @brief Drop every scene, reset the tag index and stop the worker pool.
   * Safe to call more than once.
   */
  void clean();

  SettingsManager &getSettings() { return m_settings; }
  const SettingsManager &getSettings() const { return m_settings; }

  TagManager &getTagManager() { return m_tagManager; }
  const TagManager &getTagManager() const { return m_tagManager; }

  SceneManager &getSceneManager() { return m_sceneManager; }
  const SceneManager &getSceneManager() const { return m_sceneManager; }

  ErrorReporter &getErrorReporter() const { return *mp_errorReporter; }

  /**
   * @brief Replace the error reporter.
   * @throws std::invalid_argument for a null reporter
   */
  void setErrorReporter(std::unique_ptr<ErrorReporter> reporter);

  // Worker pool backing parallel tag queries, or nullptr when disabled
  ThreadSystem *getThreadSystem() const { return mp_threadSystem.get(); }

  bool isSwitchingScenes() const { return m_sceneManager.isSwitchingScenes(); }

private:
  void stopWorkers();

  SettingsManager m_settings;
  std::unique_ptr<ErrorReporter> mp_errorReporter;
  std::unique_ptr<ThreadSystem> mp_threadSystem;
  unsigned int m_workerThreadSetting{0};

  // Declared last so scenes are torn down before the tag index
  TagManager m_tagManager;
  SceneManager m_sceneManager;

  EngineContext(const EngineContext &) = delete;
  EngineContext &operator=(const EngineContext &) = delete;
};

} // namespace PolyForge

#endif // ENGINE_CONTEXT_HPP
