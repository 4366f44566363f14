/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/EngineContext.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace PolyForge {

EngineContext::EngineContext()
    : mp_errorReporter(std::make_unique<LoggingErrorReporter>()),
      m_sceneManager(m_tagManager) {}

EngineContext::~EngineContext() {
  clean();
}

bool EngineContext::init(const std::string &settingsPath) {
  if (!settingsPath.empty() && !m_settings.loadFromFile(settingsPath)) {
    ENGINE_WARN("Using default settings, could not load " + settingsPath);
  }

  if (!applySettings()) {
    ENGINE_ERROR("Failed to apply engine settings");
    return false;
  }

  ENGINE_INFO("Engine context initialized");
  return true;
}

bool EngineContext::applySettings() {
  Logger::SetBenchmarkMode(m_settings.get<bool>("logging", "benchmark_mode", false));

  const bool parallelQueries = m_settings.get<bool>("tags", "parallel_queries", true);
  const int workerThreads = std::max(m_settings.get<int>("tags", "worker_threads", 0), 0);
  const int sceneThreshold = std::max(m_settings.get<int>("tags", "parallel_scene_threshold", 2), 1);

  m_tagManager.setParallelQueriesEnabled(parallelQueries);

  if (!parallelQueries) {
    stopWorkers();
    return true;
  }

  // Restart the pool only when the requested size changed
  const auto requestedThreads = static_cast<unsigned int>(workerThreads);
  if (mp_threadSystem && requestedThreads != m_workerThreadSetting) {
    stopWorkers();
  }

  if (!mp_threadSystem) {
    auto threadSystem = std::make_unique<ThreadSystem>();
    if (!threadSystem->init(requestedThreads)) {
      ENGINE_ERROR("Failed to start tag query workers");
      return false;
    }
    mp_threadSystem = std::move(threadSystem);
    m_workerThreadSetting = requestedThreads;
  }

  m_tagManager.setThreadSystem(mp_threadSystem.get(), static_cast<size_t>(sceneThreshold));
  ENGINE_DEBUG(std::format("Tag queries run in parallel from {} scenes on {} workers",
                           sceneThreshold, mp_threadSystem->getThreadCount()));
  return true;
}

void EngineContext::clean() {
  m_sceneManager.clearAllScenes();
  m_tagManager.reset();
  stopWorkers();
}

void EngineContext::setErrorReporter(std::unique_ptr<ErrorReporter> reporter) {
  if (!reporter) {
    throw std::invalid_argument("PolyForge Engine - Error reporter cannot be null");
  }
  mp_errorReporter = std::move(reporter);
}

void EngineContext::stopWorkers() {
  m_tagManager.setThreadSystem(nullptr);
  if (mp_threadSystem) {
    mp_threadSystem->clean();
    mp_threadSystem.reset();
  }
}

} // namespace PolyForge
