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
#include <vector>

#include "seriallink/base/constants.hpp"
#include "seriallink/base/visibility.hpp"
#include "seriallink/framer/buffering_mode.hpp"
#include "seriallink/framer/iframer.hpp"

namespace seriallink {
namespace framer {

/**
 * @brief Per-device buffering state machine.
 *
 * Raw mode emits each chunk verbatim. Delimited modes append byte by byte
 * and emit the accumulator, delimiter included, whenever the delimiter byte
 * is appended. A timeout flushes a non-empty accumulator. A mode change
 * applies from the next chunk; bytes already accumulated stay as they are.
 */
class SERIALLINK_API BufferingFramer : public IFramer {
 public:
  /**
   * @param mode Initial buffering mode
   * @param max_length Accumulator size at which a partial message is emitted without a delimiter
   */
  explicit BufferingFramer(BufferingMode mode = Raw{}, size_t max_length = constants::DEFAULT_MAX_FRAME_LENGTH);
  ~BufferingFramer() override = default;

  void push_bytes(const uint8_t* data, size_t size) override;
  void on_timeout() override;
  void set_on_message(MessageCallback cb) override;
  void reset() override;

  void set_mode(const BufferingMode& mode);
  const BufferingMode& mode() const { return mode_; }

  /**
   * @brief Number of bytes waiting for a delimiter
   */
  size_t pending() const { return accumulator_.size(); }

 private:
  void emit_accumulator();

  BufferingMode mode_;
  size_t max_length_;
  std::vector<uint8_t> accumulator_;
  MessageCallback on_message_;
};

}  // namespace framer
}  // namespace seriallink
