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

#include <boost/system/error_code.hpp>
#include <string_view>

#include "seriallink/base/error_codes.hpp"
#include "seriallink/base/visibility.hpp"

namespace seriallink {
namespace diagnostics {

/**
 * @brief Outcome of classifying a transport error
 */
enum class ErrorClass {
  None,           // No error
  Disconnection,  // Device is gone; the session must be torn down
  Transient,      // Timeout or would-block; no data right now
  Other           // Failed operation, device assumed still present
};

/**
 * @brief Classify an error produced by a transport operation.
 *
 * Disconnection: device absent (ENODEV, ENXIO, ENOENT), broken pipe,
 * connection aborted, not connected, end of stream, permission denied
 * (device removal can revoke access). Transient: timed out, would block.
 * Everything else is Other.
 */
SERIALLINK_API ErrorClass classify_error(const boost::system::error_code& ec);

inline bool is_disconnection(const boost::system::error_code& ec) {
  return classify_error(ec) == ErrorClass::Disconnection;
}

inline bool is_transient(const boost::system::error_code& ec) { return classify_error(ec) == ErrorClass::Transient; }

/**
 * @brief Maps a transport error to a seriallink ErrorCode
 */
SERIALLINK_API ErrorCode to_seriallink_error_code(const boost::system::error_code& ec);

SERIALLINK_API std::string_view error_class_name(ErrorClass cls);

}  // namespace diagnostics
}  // namespace seriallink
