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

#include "seriallink/discovery/port_info.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

#include "seriallink/diagnostics/logger.hpp"

namespace seriallink {
namespace discovery {

namespace fs = std::filesystem;

namespace {

// Levels walked up from a tty device node to find the owning USB device
constexpr int MAX_USB_PARENT_DEPTH = 4;

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return {};
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::optional<std::string> read_attribute(const fs::path& file) {
  std::ifstream in(file);
  if (!in) return std::nullopt;
  std::string value;
  std::getline(in, value);
  value = trim(value);
  if (value.empty()) return std::nullopt;
  return value;
}

std::optional<uint16_t> read_hex_attribute(const fs::path& file) {
  auto value = read_attribute(file);
  if (!value) return std::nullopt;
  try {
    size_t used = 0;
    unsigned long parsed = std::stoul(*value, &used, 16);
    if (used != value->size() || parsed > 0xFFFF) return std::nullopt;
    return static_cast<uint16_t>(parsed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<UsbPort> find_usb_parent(const fs::path& device_dir) {
  fs::path dir = device_dir;
  for (int depth = 0; depth <= MAX_USB_PARENT_DEPTH && !dir.empty(); ++depth) {
    auto vid = read_hex_attribute(dir / "idVendor");
    auto pid = read_hex_attribute(dir / "idProduct");
    if (vid && pid) {
      UsbPort usb;
      usb.vid = *vid;
      usb.pid = *pid;
      usb.manufacturer = read_attribute(dir / "manufacturer");
      usb.product = read_attribute(dir / "product");
      usb.serial_number = read_attribute(dir / "serial");
      return usb;
    }
    if (dir == dir.root_path()) break;
    dir = dir.parent_path();
  }
  return std::nullopt;
}

std::string subsystem_of(const fs::path& device_dir) {
  std::error_code ec;
  auto target = fs::read_symlink(device_dir / "subsystem", ec);
  if (ec) return {};
  return target.filename().string();
}

PortKind classify(const std::string& name, const fs::path& tty_dir) {
  if (name.rfind("rfcomm", 0) == 0) {
    return BluetoothPort{};
  }

  std::error_code ec;
  auto device_dir = fs::canonical(tty_dir / "device", ec);
  if (ec) {
    return UnknownPort{};
  }

  if (auto usb = find_usb_parent(device_dir)) {
    return *usb;
  }
  if (subsystem_of(device_dir) == "pci") {
    return PciPort{};
  }
  return UnknownPort{};
}

struct KindLabel {
  std::string operator()(const UsbPort& usb) const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "USB - VID: %04X, PID: %04X", usb.vid, usb.pid);
    return buf;
  }
  std::string operator()(const PciPort&) const { return "PCI"; }
  std::string operator()(const BluetoothPort&) const { return "Bluetooth"; }
  std::string operator()(const UnknownPort&) const { return "Unknown"; }
};

struct DeviceName {
  std::string operator()(const UsbPort& usb) const {
    return usb_device_name(usb.vid, usb.pid, usb.manufacturer, usb.product);
  }
  std::string operator()(const PciPort&) const { return "PCI Serial Port"; }
  std::string operator()(const BluetoothPort&) const { return "Bluetooth Serial Port"; }
  std::string operator()(const UnknownPort&) const { return "Unknown Serial Device"; }
};

}  // namespace

std::string kind_label(const PortKind& kind) { return std::visit(KindLabel{}, kind); }

std::string device_name(const PortKind& kind) { return std::visit(DeviceName{}, kind); }

std::string usb_device_name(uint16_t vid, uint16_t pid, const std::optional<std::string>& manufacturer,
                            const std::optional<std::string>& product) {
  std::string name;
  if (manufacturer) {
    name = trim(*manufacturer);
  }
  if (product) {
    auto p = trim(*product);
    if (!p.empty()) {
      if (!name.empty()) name += ' ';
      name += p;
    }
  }
  if (!name.empty()) {
    return name;
  }

  char buf[48];
  std::snprintf(buf, sizeof(buf), "USB Serial (VID: 0x%04X, PID: 0x%04X)", vid, pid);
  return buf;
}

std::vector<PortInfo> list_ports() { return list_ports("/sys/class/tty", "/dev"); }

std::vector<PortInfo> list_ports(const fs::path& tty_class_dir, const fs::path& dev_dir) {
  std::vector<PortInfo> ports;

  std::error_code ec;
  fs::directory_iterator it(tty_class_dir, ec);
  if (ec) {
    SERIALLINK_LOG_ERROR("discovery", "list_ports",
                         "Failed to list ports in " + tty_class_dir.string() + ": " + ec.message());
    return ports;
  }

  for (const auto& entry : it) {
    auto name = entry.path().filename().string();
    std::error_code exists_ec;
    bool has_device = fs::exists(entry.path() / "device", exists_ec);
    // Virtual consoles and ptys have no backing device
    if (!has_device && name.rfind("rfcomm", 0) != 0) {
      continue;
    }

    PortInfo info;
    info.id = (dev_dir / name).string();
    info.kind = classify(name, entry.path());
    info.kind_label = kind_label(info.kind);
    info.device_name = device_name(info.kind);
    ports.push_back(std::move(info));
  }

  std::sort(ports.begin(), ports.end(), [](const PortInfo& a, const PortInfo& b) { return a.id < b.id; });
  SERIALLINK_LOG_DEBUG("discovery", "list_ports", "Found " + std::to_string(ports.size()) + " port(s)");
  return ports;
}

}  // namespace discovery
}  // namespace seriallink
