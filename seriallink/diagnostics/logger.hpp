/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "seriallink/base/visibility.hpp"

// Windows headers define some of these as macros
#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CRITICAL
#undef CRITICAL
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace seriallink {
namespace diagnostics {

enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

// Bit flags, combined with set_outputs()
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Line logger shared by the session, the manager and its reader threads.
 *
 * Each record carries the component ("session", "reader", ...) and the
 * operation that produced it. Records are rendered through a pattern with
 * the placeholders {timestamp}, {level}, {component}, {operation},
 * {message} and {thread}; anything else in braces is copied as is.
 * Console output goes to stderr for ERROR and above, stdout otherwise.
 */
class SERIALLINK_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  static Logger& instance();

  Logger();
  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level);
  LogLevel get_level() const;

  void set_console_output(bool enable);

  /**
   * @brief Append records to a file; an empty name closes it
   */
  void set_file_output(const std::string& filename);

  // A null callback removes the callback output
  void set_callback(LogCallback callback);

  void set_outputs(int outputs);
  int get_outputs() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  void set_format(const std::string& format);

  void flush();

  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);
  void critical(std::string_view component, std::string_view operation, std::string_view message);

  static std::string_view level_to_string(LogLevel level);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Hex preview of a byte buffer for log messages, e.g. "41 42 0D 0A".
 *
 * At most max_bytes are shown; longer buffers end with " ... (N bytes)".
 */
SERIALLINK_API std::string hex_preview(const uint8_t* data, size_t size, size_t max_bytes = 16);

}  // namespace diagnostics
}  // namespace seriallink

// The message expression is only evaluated when the level is enabled.
#define SERIALLINK_LOG_AT(lvl, method, component, operation, message)                                \
  do {                                                                                             \
    auto& seriallink_logger_ = ::seriallink::diagnostics::Logger::instance();                      \
    if (seriallink_logger_.get_level() <= ::seriallink::diagnostics::LogLevel::lvl) {              \
      seriallink_logger_.method(component, operation, message);                                    \
    }                                                                                              \
  } while (0)

#define SERIALLINK_LOG_DEBUG(component, operation, message) \
  SERIALLINK_LOG_AT(DEBUG, debug, component, operation, message)
#define SERIALLINK_LOG_INFO(component, operation, message) SERIALLINK_LOG_AT(INFO, info, component, operation, message)
#define SERIALLINK_LOG_WARNING(component, operation, message) \
  SERIALLINK_LOG_AT(WARNING, warning, component, operation, message)
#define SERIALLINK_LOG_ERROR(component, operation, message) \
  SERIALLINK_LOG_AT(ERROR, error, component, operation, message)
#define SERIALLINK_LOG_CRITICAL(component, operation, message) \
  SERIALLINK_LOG_AT(CRITICAL, critical, component, operation, message)
