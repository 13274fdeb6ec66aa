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

#include <memory>
#include <mutex>
#include <utility>

#include "seriallink/interface/iserial_port.hpp"

namespace seriallink {
namespace manager {

/**
 * @brief A transport shared by a reader task and the manager's foreground calls.
 *
 * Holders lock `mutex` around each individual transport call and never keep
 * it across more than one.
 */
struct SharedPort {
  explicit SharedPort(std::unique_ptr<interface::SerialPortInterface> p) : port(std::move(p)) {}

  std::mutex mutex;
  std::unique_ptr<interface::SerialPortInterface> port;
};

}  // namespace manager
}  // namespace seriallink
