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
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

#include "seriallink/manager/port_event.hpp"

namespace seriallink {
namespace manager {

/**
 * @brief Multi-producer queue of port events, drained in one go by the consumer.
 *
 * Events from all devices share one sequence, so drain() returns them in the
 * order they were pushed.
 */
class EventQueue {
 public:
  void push(PortEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
  }

  // Never blocks waiting for events
  std::vector<PortEvent> drain() {
    std::deque<PortEvent> taken;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      taken.swap(events_);
    }
    return std::vector<PortEvent>(std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

  bool empty() const { return size() == 0; }

 private:
  mutable std::mutex mutex_;
  std::deque<PortEvent> events_;
};

}  // namespace manager
}  // namespace seriallink
