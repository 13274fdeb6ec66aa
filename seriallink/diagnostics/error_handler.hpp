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

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "seriallink/base/visibility.hpp"
#include "seriallink/diagnostics/error_types.hpp"

namespace seriallink {
namespace diagnostics {

/**
 * @brief Side channel for failures that the serial API reports only as false, empty or zero.
 *
 * Keeps counters, a bounded history overall and per component, and forwards
 * each record to the registered callbacks on the reporting thread (which may
 * be a reader thread). Callbacks that throw are logged and skipped.
 */
class SERIALLINK_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  static ErrorHandler& instance();

  ErrorHandler() = default;
  ~ErrorHandler() = default;

  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  void report_error(const ErrorInfo& error);

  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  // Records below this level are dropped
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;
  void reset_stats();

  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;

  // Oldest first
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  bool has_errors(const std::string& component) const;
  size_t get_error_count(const std::string& component, ErrorCategory category) const;

 private:
  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  ErrorStats stats_;
  std::deque<ErrorInfo> recent_;
  std::map<std::string, std::deque<ErrorInfo>> by_component_;
};

/**
 * @brief One reporter per failure class, all recording with ErrorHandler::instance().
 *
 * Logging stays with the caller.
 */
namespace error_reporting {

// ERROR level
SERIALLINK_API void report_configuration_error(const std::string& component, const std::string& operation,
                                               const std::string& message);

// ERROR level, message taken from the error code
SERIALLINK_API void report_connectivity_error(const std::string& component, const std::string& operation,
                                              const boost::system::error_code& ec);

// WARNING level
SERIALLINK_API void report_protocol_error(const std::string& component, const std::string& operation,
                                          const std::string& message);

// CRITICAL level
SERIALLINK_API void report_concurrency_fault(const std::string& component, const std::string& operation,
                                             const std::string& message);

SERIALLINK_API void report_system_error(const std::string& component, const std::string& operation,
                                        const std::string& message,
                                        const boost::system::error_code& ec = boost::system::error_code{});

SERIALLINK_API void report_warning(const std::string& component, const std::string& operation,
                                   const std::string& message);

SERIALLINK_API void report_info(const std::string& component, const std::string& operation,
                                const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace seriallink
