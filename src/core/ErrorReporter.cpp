/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ErrorReporter.hpp"
#include "core/Logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <format>

namespace PolyForge {

void LoggingErrorReporter::error(const std::string &message,
                                 const std::string &cause) {
  m_errorCount.fetch_add(1, std::memory_order_relaxed);
  ENGINE_ERROR(std::format("{} Cause: {}", message, cause));
}

void LoggingErrorReporter::fatal(const std::string &message,
                                 const std::string &cause) {
  ENGINE_CRITICAL(std::format("{} Cause: {}", message, cause));
  ENGINE_CRITICAL("Engine halted after an unrecoverable error");
  std::fflush(stdout);
  std::exit(EXIT_FAILURE);
}

} // namespace PolyForge
