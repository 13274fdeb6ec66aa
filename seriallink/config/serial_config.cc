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

#include "seriallink/config/serial_config.hpp"

#include <algorithm>
#include <cctype>

namespace seriallink {
namespace config {

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

std::optional<SerialConfig::Parity> parity_from_int(int value) {
  switch (value) {
    case 0:
      return SerialConfig::Parity::None;
    case 1:
      return SerialConfig::Parity::Odd;
    case 2:
      return SerialConfig::Parity::Even;
    default:
      return std::nullopt;
  }
}

std::optional<SerialConfig::Flow> flow_from_int(int value) {
  switch (value) {
    case 0:
      return SerialConfig::Flow::None;
    case 1:
      return SerialConfig::Flow::Software;
    case 2:
      return SerialConfig::Flow::Hardware;
    default:
      return std::nullopt;
  }
}

std::optional<SerialConfig::Parity> parity_from_string(const std::string& value) {
  auto v = lowercase(value);
  if (v == "none") return SerialConfig::Parity::None;
  if (v == "odd") return SerialConfig::Parity::Odd;
  if (v == "even") return SerialConfig::Parity::Even;
  return std::nullopt;
}

std::optional<SerialConfig::Flow> flow_from_string(const std::string& value) {
  auto v = lowercase(value);
  if (v == "none") return SerialConfig::Flow::None;
  if (v == "software" || v == "xonxoff") return SerialConfig::Flow::Software;
  if (v == "hardware" || v == "rtscts") return SerialConfig::Flow::Hardware;
  return std::nullopt;
}

const char* to_cstr(SerialConfig::Parity parity) {
  switch (parity) {
    case SerialConfig::Parity::None:
      return "none";
    case SerialConfig::Parity::Odd:
      return "odd";
    case SerialConfig::Parity::Even:
      return "even";
  }
  return "unknown";
}

const char* to_cstr(SerialConfig::Flow flow) {
  switch (flow) {
    case SerialConfig::Flow::None:
      return "none";
    case SerialConfig::Flow::Software:
      return "software";
    case SerialConfig::Flow::Hardware:
      return "hardware";
  }
  return "unknown";
}

std::string describe(const SerialConfig& cfg) {
  char parity = 'N';
  if (cfg.parity == SerialConfig::Parity::Odd) {
    parity = 'O';
  } else if (cfg.parity == SerialConfig::Parity::Even) {
    parity = 'E';
  }

  std::string out = cfg.device.empty() ? std::string("<unset>") : cfg.device;
  out += " @ " + std::to_string(cfg.baud_rate) + " ";
  out += std::to_string(cfg.data_bits);
  out += parity;
  out += std::to_string(cfg.stop_bits);
  if (cfg.flow != SerialConfig::Flow::None) {
    out += std::string(" flow=") + to_cstr(cfg.flow);
  }
  out += " timeout=" + std::to_string(cfg.timeout.count()) + "ms";
  return out;
}

}  // namespace config
}  // namespace seriallink
