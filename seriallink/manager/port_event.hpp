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

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace seriallink {
namespace manager {

struct DataEvent {
  std::string device_id;
  std::vector<uint8_t> bytes;
};

struct DisconnectedEvent {
  std::string device_id;
};

using PortEvent = std::variant<DataEvent, DisconnectedEvent>;

inline const std::string& device_id_of(const PortEvent& event) {
  return std::visit([](const auto& e) -> const std::string& { return e.device_id; }, event);
}

}  // namespace manager
}  // namespace seriallink
