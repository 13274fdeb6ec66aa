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
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "seriallink/base/visibility.hpp"
#include "seriallink/config/manager_config.hpp"
#include "seriallink/framer/buffering_mode.hpp"
#include "seriallink/manager/event_queue.hpp"
#include "seriallink/manager/shared_port.hpp"

namespace seriallink {
namespace manager {

/**
 * @brief Buffering mode shared between the manager (writer) and one reader task
 */
class ModeCell {
 public:
  explicit ModeCell(framer::BufferingMode mode) : mode_(std::move(mode)) {}

  framer::BufferingMode get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
  }

  void set(const framer::BufferingMode& mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
  }

 private:
  mutable std::mutex mutex_;
  framer::BufferingMode mode_;
};

/**
 * @brief Background read loop for one device.
 *
 * Each iteration checks the stop flag, performs one bounded read under the
 * port mutex, feeds the result to a BufferingFramer and sleeps for the poll
 * interval. A disconnection, any other read error or a fault while taking
 * the port lock drops the partial frame, pushes a single DisconnectedEvent
 * and ends the loop.
 *
 * The thread works on state it shares with the task object, so the task may
 * be destroyed from its own thread (host code reached through a log or error
 * callback). In that case the thread is detached and finishes on its own.
 */
class SERIALLINK_API ReaderTask {
 public:
  ReaderTask(std::string device_id, std::shared_ptr<SharedPort> port, std::shared_ptr<ModeCell> mode,
             std::shared_ptr<EventQueue> queue, const config::ManagerConfig& cfg);
  ~ReaderTask();

  ReaderTask(const ReaderTask&) = delete;
  ReaderTask& operator=(const ReaderTask&) = delete;

  void start();

  // Sets the stop flag without waiting
  void request_stop();

  /**
   * @brief Request stop and wait for the thread to exit.
   *
   * Must not be called from the task's own thread.
   */
  void stop();

  /**
   * @brief Stop without waiting and close the port once the loop has exited.
   *
   * For retiring a device from its own reader thread, where neither joining
   * nor taking the port mutex is possible.
   */
  void abandon();

  bool running() const;
  bool on_task_thread() const { return thread_.get_id() == std::this_thread::get_id(); }
  const std::string& device_id() const;

 private:
  struct State;

  static void run(const std::shared_ptr<State>& state);
  static void signal_disconnected(State& state);

  std::shared_ptr<State> state_;
  std::thread thread_;
};

}  // namespace manager
}  // namespace seriallink
