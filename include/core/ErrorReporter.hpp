/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ERROR_REPORTER_HPP
#define ERROR_REPORTER_HPP

#include <atomic>
#include <cstddef>
#include <string>

namespace PolyForge {

/**
 * @brief Sink for engine errors.
 *
 * error() is for conditions the engine degrades around (the caller carries on
 * with a safe default). fatal() is for invariant violations caused by engine
 * or content bugs; the engine run does not continue past it.
 */
class ErrorReporter {
public:
  virtual ~ErrorReporter() = default;

  /**
   * @brief Report a recoverable error.
   * @param message What the engine was doing
   * @param cause The specific condition that failed
   */
  virtual void error(const std::string &message, const std::string &cause) = 0;

  /**
   * @brief Report an invariant violation and end the engine run.
   *
   * The production reporter does not return. Test reporters may return, in
   * which case the caller must leave its state untouched.
   */
  virtual void fatal(const std::string &message, const std::string &cause) = 0;
};

/**
 * @brief Default reporter: logs through the engine logger, terminates on fatal.
 */
class LoggingErrorReporter : public ErrorReporter {
public:
  void error(const std::string &message, const std::string &cause) override;
  [[noreturn]] void fatal(const std::string &message,
                          const std::string &cause) override;

  size_t getErrorCount() const {
    return m_errorCount.load(std::memory_order_relaxed);
  }

private:
  std::atomic<size_t> m_errorCount{0};
};

} // namespace PolyForge

#endif // ERROR_REPORTER_HPP
