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
#include <optional>
#include <string>
#include <variant>

#include "seriallink/base/constants.hpp"
#include "seriallink/base/visibility.hpp"

namespace seriallink {
namespace framer {

/// Every read chunk is one message.
struct Raw {};

/// Messages end with (and include) a line feed.
struct LineDelimited {};

/// Messages end with (and include) an arbitrary byte.
struct CustomDelimiter {
  uint8_t delimiter = constants::LINE_FEED;
};

inline bool operator==(const Raw&, const Raw&) { return true; }
inline bool operator==(const LineDelimited&, const LineDelimited&) { return true; }
inline bool operator==(const CustomDelimiter& a, const CustomDelimiter& b) { return a.delimiter == b.delimiter; }

using BufferingMode = std::variant<Raw, LineDelimited, CustomDelimiter>;

/**
 * @brief Host-facing integer encoding: 0=Raw, 1=LineDelimited, 2=CustomDelimiter(LF)
 */
SERIALLINK_API std::optional<BufferingMode> mode_from_int(int mode);

/**
 * @brief The byte that terminates a frame, or nullopt in Raw mode
 */
SERIALLINK_API std::optional<uint8_t> delimiter_of(const BufferingMode& mode);

SERIALLINK_API std::string describe(const BufferingMode& mode);

}  // namespace framer
}  // namespace seriallink
