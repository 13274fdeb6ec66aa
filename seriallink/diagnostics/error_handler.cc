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

#include "seriallink/diagnostics/error_handler.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "seriallink/base/constants.hpp"
#include "seriallink/diagnostics/logger.hpp"

namespace seriallink {
namespace diagnostics {

namespace {

void push_bounded(std::deque<ErrorInfo>& history, const ErrorInfo& error, size_t limit) {
  history.push_back(error);
  while (history.size() > limit) {
    history.pop_front();
  }
}

}  // namespace

const char* to_string(ErrorLevel level) {
  switch (level) {
    case ErrorLevel::INFO:
      return "INFO";
    case ErrorLevel::WARNING:
      return "WARNING";
    case ErrorLevel::ERROR:
      return "ERROR";
    case ErrorLevel::CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

const char* to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::CONFIGURATION:
      return "CONFIGURATION";
    case ErrorCategory::CONNECTIVITY:
      return "CONNECTIVITY";
    case ErrorCategory::TRANSIENT:
      return "TRANSIENT";
    case ErrorCategory::PROTOCOL:
      return "PROTOCOL";
    case ErrorCategory::CONCURRENCY:
      return "CONCURRENCY";
    case ErrorCategory::SYSTEM:
      return "SYSTEM";
    case ErrorCategory::UNKNOWN:
      break;
  }
  return "UNKNOWN";
}

ErrorInfo::ErrorInfo(ErrorLevel l, ErrorCategory c, std::string comp, std::string op, std::string msg,
                     boost::system::error_code ec)
    : level(l),
      category(c),
      component(std::move(comp)),
      operation(std::move(op)),
      message(std::move(msg)),
      boost_error(ec),
      timestamp(std::chrono::system_clock::now()) {}

std::string ErrorInfo::get_summary() const {
  std::string out;
  out += '[';
  out += to_string(level);
  out += "] [";
  out += to_string(category);
  out += "] [" + component + "] [" + operation + "] " + message;
  if (boost_error) {
    out += " (system: " + boost_error.message() + ", code: " + std::to_string(boost_error.value()) + ")";
  }
  return out;
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler handler;
  return handler;
}

void ErrorHandler::report_error(const ErrorInfo& error) {
  if (!enabled_.load() || error.level < min_level_.load()) {
    return;
  }

  std::vector<ErrorCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.record(error);
    push_bounded(recent_, error, constants::MAX_RECENT_ERRORS);
    push_bounded(by_component_[error.component], error, constants::MAX_COMPONENT_ERRORS);
    callbacks = callbacks_;
  }

  for (const auto& callback : callbacks) {
    try {
      callback(error);
    } catch (const std::exception& e) {
      // Logged rather than reported, reporting here would recurse
      SERIALLINK_LOG_ERROR("error_handler", "callback", std::string("Error callback threw: ") + e.what());
    }
  }
}

void ErrorHandler::register_callback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ErrorHandler::clear_callbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.clear();
}

void ErrorHandler::set_min_error_level(ErrorLevel level) { min_level_.store(level); }

ErrorLevel ErrorHandler::get_min_error_level() const { return min_level_.load(); }

void ErrorHandler::set_enabled(bool enabled) { enabled_.store(enabled); }

bool ErrorHandler::is_enabled() const { return enabled_.load(); }

ErrorStats ErrorHandler::get_error_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ErrorHandler::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.reset();
  recent_.clear();
  by_component_.clear();
}

std::vector<ErrorInfo> ErrorHandler::get_errors_by_component(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_component_.find(component);
  if (it == by_component_.end()) {
    return {};
  }
  return std::vector<ErrorInfo>(it->second.begin(), it->second.end());
}

std::vector<ErrorInfo> ErrorHandler::get_recent_errors(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t take = std::min(count, recent_.size());
  return std::vector<ErrorInfo>(recent_.end() - static_cast<std::ptrdiff_t>(take), recent_.end());
}

bool ErrorHandler::has_errors(const std::string& component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_component_.find(component);
  return it != by_component_.end() && !it->second.empty();
}

size_t ErrorHandler::get_error_count(const std::string& component, ErrorCategory category) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_component_.find(component);
  if (it == by_component_.end()) {
    return 0;
  }
  return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
                                           [category](const ErrorInfo& e) { return e.category == category; }));
}

namespace error_reporting {

namespace {

void submit(ErrorLevel level, ErrorCategory category, const std::string& component, const std::string& operation,
            const std::string& message, const boost::system::error_code& ec = {}) {
  ErrorHandler::instance().report_error(ErrorInfo(level, category, component, operation, message, ec));
}

}  // namespace

void report_configuration_error(const std::string& component, const std::string& operation,
                                const std::string& message) {
  submit(ErrorLevel::ERROR, ErrorCategory::CONFIGURATION, component, operation, message);
}

void report_connectivity_error(const std::string& component, const std::string& operation,
                               const boost::system::error_code& ec) {
  submit(ErrorLevel::ERROR, ErrorCategory::CONNECTIVITY, component, operation, ec.message(), ec);
}

void report_protocol_error(const std::string& component, const std::string& operation, const std::string& message) {
  submit(ErrorLevel::WARNING, ErrorCategory::PROTOCOL, component, operation, message);
}

void report_concurrency_fault(const std::string& component, const std::string& operation,
                              const std::string& message) {
  submit(ErrorLevel::CRITICAL, ErrorCategory::CONCURRENCY, component, operation, message);
}

void report_system_error(const std::string& component, const std::string& operation, const std::string& message,
                         const boost::system::error_code& ec) {
  submit(ErrorLevel::ERROR, ErrorCategory::SYSTEM, component, operation, message, ec);
}

void report_warning(const std::string& component, const std::string& operation, const std::string& message) {
  submit(ErrorLevel::WARNING, ErrorCategory::UNKNOWN, component, operation, message);
}

void report_info(const std::string& component, const std::string& operation, const std::string& message) {
  submit(ErrorLevel::INFO, ErrorCategory::UNKNOWN, component, operation, message);
}

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace seriallink
