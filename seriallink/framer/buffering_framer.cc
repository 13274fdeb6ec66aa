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

#include "seriallink/framer/buffering_framer.hpp"

#include <cstdio>
#include <utility>

namespace seriallink {
namespace framer {

std::optional<BufferingMode> mode_from_int(int mode) {
  switch (mode) {
    case 0:
      return BufferingMode{Raw{}};
    case 1:
      return BufferingMode{LineDelimited{}};
    case 2:
      return BufferingMode{CustomDelimiter{constants::LINE_FEED}};
    default:
      return std::nullopt;
  }
}

std::optional<uint8_t> delimiter_of(const BufferingMode& mode) {
  if (std::holds_alternative<LineDelimited>(mode)) {
    return constants::LINE_FEED;
  }
  if (const auto* custom = std::get_if<CustomDelimiter>(&mode)) {
    return custom->delimiter;
  }
  return std::nullopt;
}

std::string describe(const BufferingMode& mode) {
  if (std::holds_alternative<Raw>(mode)) {
    return "raw";
  }
  if (std::holds_alternative<LineDelimited>(mode)) {
    return "line";
  }
  char buf[24];
  std::snprintf(buf, sizeof(buf), "delimiter(0x%02X)", std::get<CustomDelimiter>(mode).delimiter);
  return buf;
}

BufferingFramer::BufferingFramer(BufferingMode mode, size_t max_length)
    : mode_(std::move(mode)), max_length_(max_length == 0 ? constants::DEFAULT_MAX_FRAME_LENGTH : max_length) {}

void BufferingFramer::push_bytes(const uint8_t* data, size_t size) {
  if (data == nullptr || size == 0) return;

  auto delimiter = delimiter_of(mode_);
  if (!delimiter) {
    // Left over from a delimited mode; goes out first to keep stream order
    if (!accumulator_.empty()) emit_accumulator();
    if (on_message_) on_message_(std::vector<uint8_t>(data, data + size));
    return;
  }

  // Append-then-check: the delimiter byte ends up inside the emitted message
  for (size_t i = 0; i < size; ++i) {
    accumulator_.push_back(data[i]);
    if (data[i] == *delimiter || accumulator_.size() >= max_length_) {
      emit_accumulator();
    }
  }
}

void BufferingFramer::on_timeout() {
  // Raw mode never accumulates, so only a remainder from a delimited mode can be pending here
  if (!accumulator_.empty()) {
    emit_accumulator();
  }
}

void BufferingFramer::set_on_message(MessageCallback cb) { on_message_ = std::move(cb); }

void BufferingFramer::reset() { accumulator_.clear(); }

void BufferingFramer::set_mode(const BufferingMode& mode) { mode_ = mode; }

void BufferingFramer::emit_accumulator() {
  std::vector<uint8_t> message;
  message.swap(accumulator_);
  if (on_message_) on_message_(std::move(message));
}

}  // namespace framer
}  // namespace seriallink
