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

#include <array>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <string>

#include "seriallink/base/visibility.hpp"

namespace seriallink {
namespace diagnostics {

enum class ErrorLevel { INFO = 0, WARNING = 1, ERROR = 2, CRITICAL = 3 };

/**
 * @brief What went wrong, as far as the caller of a serial operation cares.
 *
 * CONFIGURATION: a parameter was out of range and the previous value was kept.
 * CONNECTIVITY: the device is gone and its session or reader was torn down.
 * TRANSIENT: a read timed out; never recorded by the library itself.
 * PROTOCOL: bytes arrived but could not be decoded.
 * CONCURRENCY: shared access to a device failed; only that device is affected.
 * SYSTEM: any other OS error, the device stays open.
 */
enum class ErrorCategory { CONFIGURATION = 0, CONNECTIVITY, TRANSIENT, PROTOCOL, CONCURRENCY, SYSTEM, UNKNOWN };

constexpr size_t ERROR_LEVEL_COUNT = 4;
constexpr size_t ERROR_CATEGORY_COUNT = 7;

SERIALLINK_API const char* to_string(ErrorLevel level);
SERIALLINK_API const char* to_string(ErrorCategory category);

struct SERIALLINK_API ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;  // session, manager, reader, transport, ...
  std::string operation;  // open, read, write, probe, ...
  std::string message;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;

  ErrorInfo(ErrorLevel l, ErrorCategory c, std::string comp, std::string op, std::string msg,
            boost::system::error_code ec = {});

  // "[LEVEL] [CATEGORY] [component] [operation] message (system: ..., code: N)"
  std::string get_summary() const;
};

struct ErrorStats {
  size_t total_errors = 0;
  std::array<size_t, ERROR_LEVEL_COUNT> errors_by_level{};
  std::array<size_t, ERROR_CATEGORY_COUNT> errors_by_category{};
  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void record(const ErrorInfo& error) {
    if (total_errors++ == 0) first_error = error.timestamp;
    last_error = error.timestamp;
    ++errors_by_level[static_cast<size_t>(error.level)];
    ++errors_by_category[static_cast<size_t>(error.category)];
  }

  void reset() { *this = ErrorStats{}; }

  size_t count(ErrorCategory category) const { return errors_by_category[static_cast<size_t>(category)]; }
  size_t count(ErrorLevel level) const { return errors_by_level[static_cast<size_t>(level)]; }
};

}  // namespace diagnostics
}  // namespace seriallink
