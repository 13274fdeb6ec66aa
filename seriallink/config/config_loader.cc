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

#include "seriallink/config/config_loader.hpp"

#ifdef SERIALLINK_ENABLE_YAML
#include <yaml-cpp/yaml.h>
#endif

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "seriallink/diagnostics/logger.hpp"

namespace seriallink {
namespace config {

#ifdef SERIALLINK_ENABLE_YAML
namespace {

template <typename T>
T get_or(const YAML::Node& n, const char* key, T defv) {
  if (n[key]) return n[key].as<T>();
  return defv;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

YAML::Node load_root(const std::string& path) {
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw ConfigLoadError("Cannot read configuration file: " + path);
  } catch (const YAML::Exception& e) {
    throw ConfigLoadError("Malformed YAML in " + path + ": " + e.what());
  }
}

SerialConfig::Parity parse_parity(const YAML::Node& n) {
  std::optional<SerialConfig::Parity> parity;
  try {
    parity = parity_from_int(n.as<int>());
  } catch (const YAML::BadConversion&) {
    parity = parity_from_string(n.as<std::string>());
  }
  if (!parity) throw ConfigLoadError("Invalid parity: " + n.as<std::string>());
  return *parity;
}

SerialConfig::Flow parse_flow(const YAML::Node& n) {
  std::optional<SerialConfig::Flow> flow;
  try {
    flow = flow_from_int(n.as<int>());
  } catch (const YAML::BadConversion&) {
    flow = flow_from_string(n.as<std::string>());
  }
  if (!flow) throw ConfigLoadError("Invalid flow_control: " + n.as<std::string>());
  return *flow;
}

uint8_t parse_delimiter(const YAML::Node& n) {
  try {
    int value = n.as<int>();
    if (value < 0 || value > 255) throw ConfigLoadError("Delimiter out of byte range: " + std::to_string(value));
    return static_cast<uint8_t>(value);
  } catch (const YAML::BadConversion&) {
    auto s = n.as<std::string>();
    if (s == "\\n") return constants::LINE_FEED;
    if (s == "\\r") return constants::CARRIAGE_RETURN;
    if (s.size() != 1) throw ConfigLoadError("Delimiter must be one byte: '" + s + "'");
    return static_cast<uint8_t>(s[0]);
  }
}

framer::BufferingMode parse_mode(const YAML::Node& n) {
  std::optional<framer::BufferingMode> mode;
  try {
    mode = framer::mode_from_int(n.as<int>());
  } catch (const YAML::BadConversion&) {
    auto s = lower(n.as<std::string>());
    if (s == "raw") {
      mode = framer::Raw{};
    } else if (s == "line") {
      mode = framer::LineDelimited{};
    } else if (s == "delimiter") {
      mode = framer::CustomDelimiter{};
    }
  }
  if (!mode) throw ConfigLoadError("Invalid buffering mode: " + n.as<std::string>());
  return *mode;
}

std::chrono::milliseconds parse_timeout(const YAML::Node& n, const char* key, std::chrono::milliseconds defv) {
  if (!n[key]) return defv;
  long long ms = n[key].as<long long>();
  std::chrono::milliseconds timeout(ms);
  if (!SerialConfig::valid_timeout(timeout)) {
    throw ConfigLoadError(std::string(key) + " out of range: " + std::to_string(ms));
  }
  return timeout;
}

}  // namespace
#endif

SerialConfig load_serial_config(const std::string& path) {
#ifndef SERIALLINK_ENABLE_YAML
  (void)path;
  throw ConfigLoadError("YAML support disabled. Build with -DSERIALLINK_ENABLE_YAML_CONFIG=ON");
#else
  YAML::Node root = load_root(path);
  SerialConfig c;
  try {
    c.device = get_or<std::string>(root, "device", c.device);
    c.baud_rate = get_or<unsigned>(root, "baud_rate", c.baud_rate);
    c.data_bits = get_or<unsigned>(root, "data_bits", c.data_bits);
    c.stop_bits = get_or<unsigned>(root, "stop_bits", c.stop_bits);
    if (root["parity"]) c.parity = parse_parity(root["parity"]);
    if (root["flow_control"]) c.flow = parse_flow(root["flow_control"]);
    c.timeout = parse_timeout(root, "timeout_ms", c.timeout);
  } catch (const YAML::Exception& e) {
    throw ConfigLoadError("Invalid value in " + path + ": " + e.what());
  }

  if (!SerialConfig::valid_baud_rate(c.baud_rate))
    throw ConfigLoadError("baud_rate out of range: " + std::to_string(c.baud_rate));
  if (!SerialConfig::valid_data_bits(c.data_bits))
    throw ConfigLoadError("data_bits must be 6, 7 or 8: " + std::to_string(c.data_bits));
  if (!SerialConfig::valid_stop_bits(c.stop_bits))
    throw ConfigLoadError("stop_bits must be 1 or 2: " + std::to_string(c.stop_bits));

  SERIALLINK_LOG_DEBUG("config", "load_serial_config", "Loaded " + describe(c) + " from " + path);
  return c;
#endif
}

ManagerConfig load_manager_config(const std::string& path) {
#ifndef SERIALLINK_ENABLE_YAML
  (void)path;
  throw ConfigLoadError("YAML support disabled. Build with -DSERIALLINK_ENABLE_YAML_CONFIG=ON");
#else
  YAML::Node root = load_root(path);
  ManagerConfig c;
  try {
    c.poll_interval = std::chrono::milliseconds(
        get_or<long long>(root, "poll_interval_ms", static_cast<long long>(c.poll_interval.count())));
    c.read_chunk = get_or<size_t>(root, "read_chunk", c.read_chunk);
    c.max_frame_length = get_or<size_t>(root, "max_frame_length", c.max_frame_length);
    c.default_baud_rate = get_or<unsigned>(root, "default_baud_rate", c.default_baud_rate);
    c.default_timeout = parse_timeout(root, "default_timeout_ms", c.default_timeout);
  } catch (const YAML::Exception& e) {
    throw ConfigLoadError("Invalid value in " + path + ": " + e.what());
  }

  if (!c.is_valid()) {
    throw ConfigLoadError("Manager configuration out of range in " + path);
  }
  return c;
#endif
}

PortSpec default_port_spec(const std::string& id, const ManagerConfig& defaults) {
  PortSpec spec;
  spec.id = id;
  spec.baud_rate = defaults.default_baud_rate;
  spec.timeout = defaults.default_timeout;
  return spec;
}

std::vector<PortSpec> load_port_list(const std::string& path, const ManagerConfig& defaults) {
#ifndef SERIALLINK_ENABLE_YAML
  (void)path;
  (void)defaults;
  throw ConfigLoadError("YAML support disabled. Build with -DSERIALLINK_ENABLE_YAML_CONFIG=ON");
#else
  YAML::Node root = load_root(path);
  YAML::Node ports = root["ports"];
  if (!ports || !ports.IsSequence()) {
    throw ConfigLoadError("Missing 'ports' list in " + path);
  }

  std::vector<PortSpec> specs;
  for (const auto& node : ports) {
    PortSpec spec = default_port_spec("", defaults);
    try {
      if (!node["id"]) throw ConfigLoadError("Port entry without 'id' in " + path);
      spec.id = node["id"].as<std::string>();
      spec.baud_rate = get_or<unsigned>(node, "baud", spec.baud_rate);
      spec.timeout = parse_timeout(node, "timeout_ms", spec.timeout);
      if (node["mode"]) spec.mode = parse_mode(node["mode"]);
      if (node["delimiter"]) spec.mode = framer::CustomDelimiter{parse_delimiter(node["delimiter"])};
    } catch (const YAML::Exception& e) {
      throw ConfigLoadError("Invalid port entry in " + path + ": " + e.what());
    }

    if (spec.id.empty()) throw ConfigLoadError("Empty port id in " + path);
    if (!SerialConfig::valid_baud_rate(spec.baud_rate))
      throw ConfigLoadError("baud out of range for " + spec.id + ": " + std::to_string(spec.baud_rate));
    specs.push_back(std::move(spec));
  }

  SERIALLINK_LOG_DEBUG("config", "load_port_list", std::to_string(specs.size()) + " port(s) from " + path);
  return specs;
#endif
}

}  // namespace config
}  // namespace seriallink
