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
#include <optional>
#include <string>

#include "seriallink/base/constants.hpp"
#include "seriallink/base/visibility.hpp"

namespace seriallink {
namespace config {

/**
 * @brief Transport parameters for one serial device.
 *
 * Plain data; the setters on SerialSession validate each field before it is
 * stored here, so a SerialConfig held by a session is always valid except for
 * an unset device.
 */
struct SerialConfig {
  std::string device;
  unsigned baud_rate = constants::DEFAULT_BAUD_RATE;
  unsigned data_bits = constants::DEFAULT_DATA_BITS;  // 6, 7 or 8
  enum class Parity { None, Odd, Even } parity = Parity::None;
  unsigned stop_bits = constants::DEFAULT_STOP_BITS;  // 1 or 2
  enum class Flow { None, Software, Hardware } flow = Flow::None;
  std::chrono::milliseconds timeout{constants::DEFAULT_TIMEOUT_MS};

  static bool valid_baud_rate(unsigned baud) {
    return baud >= constants::MIN_BAUD_RATE && baud <= constants::MAX_BAUD_RATE;
  }
  static bool valid_data_bits(unsigned bits) {
    return bits >= constants::MIN_DATA_BITS && bits <= constants::MAX_DATA_BITS;
  }
  static bool valid_stop_bits(unsigned bits) { return bits == 1 || bits == 2; }
  static bool valid_timeout(std::chrono::milliseconds timeout) {
    return timeout.count() >= 0 && timeout.count() <= static_cast<long long>(constants::MAX_TIMEOUT_MS);
  }

  bool is_valid() const {
    return !device.empty() && valid_baud_rate(baud_rate) && valid_data_bits(data_bits) && valid_stop_bits(stop_bits) &&
           valid_timeout(timeout);
  }
};

// Host-facing integer encodings: parity 0=None 1=Odd 2=Even, flow 0=None 1=Software 2=Hardware
SERIALLINK_API std::optional<SerialConfig::Parity> parity_from_int(int value);
SERIALLINK_API std::optional<SerialConfig::Flow> flow_from_int(int value);

SERIALLINK_API std::optional<SerialConfig::Parity> parity_from_string(const std::string& value);
SERIALLINK_API std::optional<SerialConfig::Flow> flow_from_string(const std::string& value);

SERIALLINK_API const char* to_cstr(SerialConfig::Parity parity);
SERIALLINK_API const char* to_cstr(SerialConfig::Flow flow);

/**
 * @brief One-line description for logs, e.g. "/dev/ttyUSB0 @ 9600 8N1"
 */
SERIALLINK_API std::string describe(const SerialConfig& cfg);

}  // namespace config
}  // namespace seriallink
