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

#include <chrono>
#include <cstddef>

#include "seriallink/base/constants.hpp"

namespace seriallink {
namespace config {

struct ManagerConfig {
  // Sleep between two reads of one reader task
  std::chrono::milliseconds poll_interval{constants::DEFAULT_POLL_INTERVAL_MS};
  // Bytes requested per read
  size_t read_chunk = constants::DEFAULT_READ_CHUNK;
  size_t max_frame_length = constants::DEFAULT_MAX_FRAME_LENGTH;
  unsigned default_baud_rate = constants::DEFAULT_BAUD_RATE;
  std::chrono::milliseconds default_timeout{constants::DEFAULT_TIMEOUT_MS};

  bool is_valid() const {
    return poll_interval.count() >= 0 && poll_interval.count() <= constants::MAX_POLL_INTERVAL_MS &&
           read_chunk >= 1 && read_chunk <= constants::MAX_READ_CHUNK && max_frame_length >= 1 &&
           default_baud_rate >= constants::MIN_BAUD_RATE && default_baud_rate <= constants::MAX_BAUD_RATE &&
           default_timeout.count() >= 0 && default_timeout.count() <= constants::MAX_TIMEOUT_MS;
  }

  // Clamp values to valid ranges
  void validate_and_clamp() {
    if (poll_interval.count() < 0) {
      poll_interval = std::chrono::milliseconds(0);
    } else if (poll_interval.count() > constants::MAX_POLL_INTERVAL_MS) {
      poll_interval = std::chrono::milliseconds(constants::MAX_POLL_INTERVAL_MS);
    }

    if (read_chunk < 1) {
      read_chunk = 1;
    } else if (read_chunk > constants::MAX_READ_CHUNK) {
      read_chunk = constants::MAX_READ_CHUNK;
    }

    if (max_frame_length < 1) {
      max_frame_length = constants::DEFAULT_MAX_FRAME_LENGTH;
    }

    if (default_baud_rate < constants::MIN_BAUD_RATE) {
      default_baud_rate = constants::MIN_BAUD_RATE;
    } else if (default_baud_rate > constants::MAX_BAUD_RATE) {
      default_baud_rate = constants::MAX_BAUD_RATE;
    }

    if (default_timeout.count() < 0) {
      default_timeout = std::chrono::milliseconds(0);
    } else if (default_timeout.count() > constants::MAX_TIMEOUT_MS) {
      default_timeout = std::chrono::milliseconds(constants::MAX_TIMEOUT_MS);
    }
  }
};

}  // namespace config
}  // namespace seriallink
