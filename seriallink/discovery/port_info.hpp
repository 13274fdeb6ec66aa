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
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "seriallink/base/visibility.hpp"

namespace seriallink {
namespace discovery {

struct UsbPort {
  uint16_t vid = 0;
  uint16_t pid = 0;
  std::optional<std::string> manufacturer;
  std::optional<std::string> product;
  std::optional<std::string> serial_number;
};

struct PciPort {};
struct BluetoothPort {};
struct UnknownPort {};

/**
 * @brief What kind of bus a serial port hangs off
 */
using PortKind = std::variant<UsbPort, PciPort, BluetoothPort, UnknownPort>;

struct PortInfo {
  std::string id;           // e.g. /dev/ttyUSB0
  PortKind kind;
  std::string kind_label;   // e.g. "USB - VID: 2341, PID: 0043"
  std::string device_name;  // e.g. "Arduino (www.arduino.cc) Arduino Uno"
};

/**
 * @brief Short technical label, one rule per kind
 */
SERIALLINK_API std::string kind_label(const PortKind& kind);

/**
 * @brief Human readable device name, one rule per kind
 */
SERIALLINK_API std::string device_name(const PortKind& kind);

/**
 * @brief Name for a USB device from its descriptor strings.
 *
 * Trimmed manufacturer and product joined by a space; when both are missing
 * or blank, "USB Serial (VID: 0xXXXX, PID: 0xXXXX)".
 */
SERIALLINK_API std::string usb_device_name(uint16_t vid, uint16_t pid, const std::optional<std::string>& manufacturer,
                                           const std::optional<std::string>& product);

/**
 * @brief Enumerate serial ports known to the system, sorted by id.
 *
 * Never throws; enumeration failures are logged and yield whatever was
 * collected so far.
 */
SERIALLINK_API std::vector<PortInfo> list_ports();

/**
 * @brief Enumerate from an explicit sysfs tty class directory.
 * @param tty_class_dir Directory laid out like /sys/class/tty
 * @param dev_dir Directory prefix for the returned ids
 */
SERIALLINK_API std::vector<PortInfo> list_ports(const std::filesystem::path& tty_class_dir,
                                                const std::filesystem::path& dev_dir);

}  // namespace discovery
}  // namespace seriallink
