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
#include <cstdint>
#include <functional>
#include <vector>

#include "seriallink/base/visibility.hpp"

namespace seriallink {
namespace framer {

/**
 * @brief Abstract base class for message framing strategies.
 *
 * Splits a serial byte stream into discrete messages. Implementations are
 * not thread-safe; each instance belongs to exactly one reader.
 */
class SERIALLINK_API IFramer {
 public:
  using MessageCallback = std::function<void(std::vector<uint8_t>)>;

  virtual ~IFramer() = default;

  /**
   * @brief Feed one read chunk.
   *
   * The message callback fires once for every message the chunk completes,
   * in stream order.
   */
  virtual void push_bytes(const uint8_t* data, size_t size) = 0;

  /**
   * @brief Signal that a read timed out with no data.
   *
   * Framers holding a partial message emit it so that latency for
   * unterminated frames stays bounded.
   */
  virtual void on_timeout() = 0;

  virtual void set_on_message(MessageCallback cb) = 0;

  /**
   * @brief Drop any buffered partial message.
   */
  virtual void reset() = 0;
};

}  // namespace framer
}  // namespace seriallink
