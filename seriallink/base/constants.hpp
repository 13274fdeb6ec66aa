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

namespace seriallink {
namespace constants {

// Transport defaults
constexpr uint32_t DEFAULT_BAUD_RATE = 9600;
constexpr uint32_t MIN_BAUD_RATE = 50;
constexpr uint32_t MAX_BAUD_RATE = 4000000;
constexpr unsigned DEFAULT_DATA_BITS = 8;
constexpr unsigned MIN_DATA_BITS = 6;
constexpr unsigned MAX_DATA_BITS = 8;
constexpr unsigned DEFAULT_STOP_BITS = 1;

// Timeouts
constexpr unsigned DEFAULT_TIMEOUT_MS = 1000;  // 1 second
constexpr unsigned MAX_TIMEOUT_MS = 60000;     // 1 minute

// Reader task
constexpr unsigned DEFAULT_POLL_INTERVAL_MS = 1;
constexpr unsigned MAX_POLL_INTERVAL_MS = 1000;
constexpr size_t DEFAULT_READ_CHUNK = 1024;
constexpr size_t MAX_READ_CHUNK = 65536;
constexpr size_t DEFAULT_MAX_FRAME_LENGTH = 65536;

// Session
constexpr size_t MAX_READ_SIZE = 64 * 1024 * 1024;  // 64MB cap for a single read()

// Diagnostics
constexpr size_t MAX_RECENT_ERRORS = 1000;
constexpr size_t MAX_COMPONENT_ERRORS = 100;

constexpr uint8_t LINE_FEED = '\n';
constexpr uint8_t CARRIAGE_RETURN = '\r';

}  // namespace constants
}  // namespace seriallink
