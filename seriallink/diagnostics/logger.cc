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

#include "seriallink/diagnostics/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace seriallink {
namespace diagnostics {

namespace {

constexpr const char* DEFAULT_PATTERN = "{timestamp} [{level}] [{component}] [{operation}] {message}";

enum class Field { Text, Timestamp, Level, Component, Operation, Message, Thread };

struct Token {
  Field field;
  std::string text;  // Field::Text only
};

using Pattern = std::vector<Token>;

Field field_for(const std::string& name) {
  if (name == "timestamp") return Field::Timestamp;
  if (name == "level") return Field::Level;
  if (name == "component") return Field::Component;
  if (name == "operation") return Field::Operation;
  if (name == "message") return Field::Message;
  if (name == "thread") return Field::Thread;
  return Field::Text;
}

std::shared_ptr<const Pattern> compile(const std::string& format) {
  auto pattern = std::make_shared<Pattern>();
  auto add_text = [&](std::string text) {
    if (text.empty()) return;
    if (!pattern->empty() && pattern->back().field == Field::Text) {
      pattern->back().text += text;
    } else {
      pattern->push_back({Field::Text, std::move(text)});
    }
  };

  size_t i = 0;
  while (i < format.size()) {
    size_t open = format.find('{', i);
    if (open == std::string::npos) {
      add_text(format.substr(i));
      break;
    }
    add_text(format.substr(i, open - i));

    size_t close = format.find('}', open);
    if (close == std::string::npos) {
      add_text(format.substr(open));
      break;
    }
    Field field = field_for(format.substr(open + 1, close - open - 1));
    if (field == Field::Text) {
      add_text(format.substr(open, close - open + 1));
    } else {
      pattern->push_back({field, {}});
    }
    i = close + 1;
  }
  return pattern;
}

// "YYYY-mm-dd HH:MM:SS.mmm" in local time
void append_timestamp(std::string& out, std::chrono::system_clock::time_point now) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm local{};
#if defined(_WIN32)
  ::localtime_s(&local, &seconds);
#else
  ::localtime_r(&seconds, &local);
#endif
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  out.append(buf, n);
  std::snprintf(buf, sizeof(buf), ".%03d", static_cast<int>(millis));
  out.append(buf);
}

std::string current_thread_id() {
  std::ostringstream os;
  os << std::this_thread::get_id();
  return os.str();
}

}  // namespace

struct Logger::Impl {
  std::atomic<LogLevel> level{LogLevel::INFO};
  std::atomic<bool> enabled{true};
  std::atomic<int> outputs{static_cast<int>(LogOutput::CONSOLE)};

  // Guards pattern, file and callback
  std::mutex mutex;
  std::shared_ptr<const Pattern> pattern = compile(DEFAULT_PATTERN);
  std::ofstream file;
  LogCallback callback;

  void toggle(LogOutput output, bool on) {
    if (on) {
      outputs.fetch_or(static_cast<int>(output));
    } else {
      outputs.fetch_and(~static_cast<int>(output));
    }
  }

  std::string render(LogLevel lvl, std::string_view component, std::string_view operation,
                     std::string_view message) {
    std::shared_ptr<const Pattern> p;
    {
      std::lock_guard<std::mutex> lock(mutex);
      p = pattern;
    }

    std::string out;
    out.reserve(message.size() + 64);
    for (const auto& token : *p) {
      switch (token.field) {
        case Field::Text:
          out += token.text;
          break;
        case Field::Timestamp:
          append_timestamp(out, std::chrono::system_clock::now());
          break;
        case Field::Level:
          out += Logger::level_to_string(lvl);
          break;
        case Field::Component:
          out += component;
          break;
        case Field::Operation:
          out += operation;
          break;
        case Field::Message:
          out += message;
          break;
        case Field::Thread:
          out += current_thread_id();
          break;
      }
    }
    return out;
  }

  void emit(LogLevel lvl, const std::string& line, int targets) {
    LogCallback cb;
    {
      // One lock for every sink keeps lines from different reader threads whole
      std::lock_guard<std::mutex> lock(mutex);
      if (targets & static_cast<int>(LogOutput::CONSOLE)) {
        auto& stream = lvl >= LogLevel::ERROR ? std::cerr : std::cout;
        stream << line << '\n';
      }
      if ((targets & static_cast<int>(LogOutput::FILE)) && file.is_open()) {
        file << line << '\n';
      }
      if (targets & static_cast<int>(LogOutput::CALLBACK)) {
        cb = callback;
      }
    }

    // Invoked outside the lock so a callback may log again
    if (cb) {
      try {
        cb(lvl, line);
      } catch (const std::exception& e) {
        std::cerr << "seriallink: log callback threw: " << e.what() << std::endl;
      }
    }
  }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() { flush(); }

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::set_level(LogLevel level) { impl_->level.store(level); }

LogLevel Logger::get_level() const { return impl_->level.load(); }

void Logger::set_console_output(bool enable) { impl_->toggle(LogOutput::CONSOLE, enable); }

void Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->file.is_open()) {
    impl_->file.close();
  }
  impl_->file.clear();

  if (!filename.empty()) {
    impl_->file.open(filename, std::ios::out | std::ios::app);
    if (!impl_->file.is_open()) {
      std::cerr << "seriallink: cannot open log file " << filename << std::endl;
    }
  }
  impl_->toggle(LogOutput::FILE, impl_->file.is_open());
}

void Logger::set_callback(LogCallback callback) {
  bool present = static_cast<bool>(callback);
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callback = std::move(callback);
  }
  impl_->toggle(LogOutput::CALLBACK, present);
}

void Logger::set_outputs(int outputs) { impl_->outputs.store(outputs); }

int Logger::get_outputs() const { return impl_->outputs.load(); }

void Logger::set_enabled(bool enabled) { impl_->enabled.store(enabled); }

bool Logger::is_enabled() const { return impl_->enabled.load(); }

void Logger::set_format(const std::string& format) {
  auto pattern = compile(format);
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->pattern = std::move(pattern);
}

void Logger::flush() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->file.is_open()) impl_->file.flush();
  }
  std::cout.flush();
  std::cerr.flush();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (!impl_->enabled.load() || level < impl_->level.load()) return;

  int targets = impl_->outputs.load();
  if (targets == 0) return;

  impl_->emit(level, impl_->render(level, component, operation, message), targets);
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

void Logger::critical(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::CRITICAL, component, operation, message);
}

std::string_view Logger::level_to_string(LogLevel level) {
  static constexpr std::string_view names[] = {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};
  auto index = static_cast<size_t>(level);
  return index < sizeof(names) / sizeof(names[0]) ? names[index] : std::string_view("UNKNOWN");
}

std::string hex_preview(const uint8_t* data, size_t size, size_t max_bytes) {
  std::string out;
  size_t shown = size < max_bytes ? size : max_bytes;
  out.reserve(shown * 3 + 24);
  char buf[4];
  for (size_t i = 0; i < shown; ++i) {
    std::snprintf(buf, sizeof(buf), i == 0 ? "%02X" : " %02X", data[i]);
    out += buf;
  }
  if (shown < size) {
    out += " ... (" + std::to_string(size) + " bytes)";
  }
  return out;
}

}  // namespace diagnostics
}  // namespace seriallink
