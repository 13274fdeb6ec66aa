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
#include <stdexcept>
#include <string>
#include <vector>

#include "seriallink/base/visibility.hpp"
#include "seriallink/config/manager_config.hpp"
#include "seriallink/config/serial_config.hpp"
#include "seriallink/framer/buffering_mode.hpp"

namespace seriallink {
namespace config {

class SERIALLINK_API ConfigLoadError : public std::runtime_error {
 public:
  explicit ConfigLoadError(const std::string& what) : std::runtime_error(what) {}
};

// One entry of a `ports:` list
struct PortSpec {
  std::string id;
  unsigned baud_rate = constants::DEFAULT_BAUD_RATE;
  std::chrono::milliseconds timeout{constants::DEFAULT_TIMEOUT_MS};
  framer::BufferingMode mode = framer::LineDelimited{};
};

/**
 * @brief Load transport parameters from a YAML file.
 *
 * Keys: device, baud_rate, data_bits, parity, stop_bits, flow_control,
 * timeout_ms. Missing keys keep their defaults; unknown keys are ignored.
 *
 * @throws ConfigLoadError on unreadable files, malformed YAML or invalid values
 */
SERIALLINK_API SerialConfig load_serial_config(const std::string& path);

/**
 * @brief Keys: poll_interval_ms, read_chunk, max_frame_length, default_baud_rate, default_timeout_ms
 * @throws ConfigLoadError
 */
SERIALLINK_API ManagerConfig load_manager_config(const std::string& path);

/**
 * @brief Load `ports: [{id, baud, timeout_ms, mode, delimiter}]`.
 *
 * mode is 0/1/2 or raw/line/delimiter; delimiter is a byte value or a one
 * character string and implies the delimiter mode. Entries without baud or
 * timeout_ms take defaults.default_baud_rate and defaults.default_timeout.
 *
 * @throws ConfigLoadError
 */
SERIALLINK_API std::vector<PortSpec> load_port_list(const std::string& path, const ManagerConfig& defaults = {});

// A port entry for `id` carrying the manager defaults
SERIALLINK_API PortSpec default_port_spec(const std::string& id, const ManagerConfig& defaults);

}  // namespace config
}  // namespace seriallink
