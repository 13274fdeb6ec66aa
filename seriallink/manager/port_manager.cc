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

#include "seriallink/manager/port_manager.hpp"

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <utility>

#include "seriallink/config/serial_config.hpp"
#include "seriallink/diagnostics/disconnect_classifier.hpp"
#include "seriallink/diagnostics/error_handler.hpp"
#include "seriallink/diagnostics/logger.hpp"
#include "seriallink/transport/serial/port_setup.hpp"

namespace seriallink {
namespace manager {

using config::SerialConfig;
using diagnostics::classify_error;
using diagnostics::ErrorClass;
namespace error_reporting = diagnostics::error_reporting;

namespace {
constexpr const char* COMPONENT = "manager";
}

PortManager::PortManager(config::ManagerConfig cfg, interface::SerialPortFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)), queue_(std::make_shared<EventQueue>()) {
  if (!cfg_.is_valid()) {
    SERIALLINK_LOG_WARNING(COMPONENT, "construct", "Manager configuration out of range, clamping");
    cfg_.validate_and_clamp();
  }
}

PortManager::~PortManager() { close_all(); }

std::vector<discovery::PortInfo> PortManager::list_ports() { return discovery::list_ports(); }

bool PortManager::open_port(const std::string& device_id, unsigned baud_rate, std::chrono::milliseconds timeout,
                            int mode) {
  auto parsed = framer::mode_from_int(mode);
  if (!parsed) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open_port", "Invalid buffering mode: " + std::to_string(mode));
    error_reporting::report_configuration_error(COMPONENT, "open_port",
                                                "Buffering mode must be 0, 1 or 2, got " + std::to_string(mode));
    return false;
  }
  return open_port(device_id, baud_rate, timeout, *parsed);
}

bool PortManager::open_port(const std::string& device_id, unsigned baud_rate, std::chrono::milliseconds timeout,
                            const framer::BufferingMode& mode) {
  if (device_id.empty()) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open_port", "Device id must not be empty");
    error_reporting::report_configuration_error(COMPONENT, "open_port", "Empty device id");
    return false;
  }
  if (!SerialConfig::valid_baud_rate(baud_rate)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open_port", "Invalid baud rate: " + std::to_string(baud_rate));
    error_reporting::report_configuration_error(COMPONENT, "open_port",
                                                "Baud rate out of range: " + std::to_string(baud_rate));
    return false;
  }
  if (!SerialConfig::valid_timeout(timeout)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open_port", "Invalid timeout: " + std::to_string(timeout.count()) + "ms");
    error_reporting::report_configuration_error(COMPONENT, "open_port",
                                                "Timeout out of range: " + std::to_string(timeout.count()));
    return false;
  }

  close_port(device_id);

  SerialConfig cfg;
  cfg.device = device_id;
  cfg.baud_rate = baud_rate;
  cfg.timeout = timeout;

  auto port = factory_();
  if (!port) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open_port", "Port factory returned no handle");
    error_reporting::report_system_error(COMPONENT, "open_port", "Port factory returned no handle");
    return false;
  }

  boost::system::error_code ec;
  if (!transport::open_configured(*port, cfg, ec)) {
    error_reporting::report_connectivity_error(COMPONENT, "open_port", ec);
    return false;
  }

  Entry entry;
  entry.port = std::make_shared<SharedPort>(std::move(port));
  entry.mode = std::make_shared<ModeCell>(mode);
  entry.task = std::make_unique<ReaderTask>(device_id, entry.port, entry.mode, queue_, cfg_);
  entry.task->start();
  spawn_count_.fetch_add(1);

  Entry displaced;
  bool raced = false;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(device_id);
    if (it != registry_.end()) {
      // Another open_port for the same id won the race since close_port() above
      displaced = std::move(it->second);
      it->second = std::move(entry);
      raced = true;
    } else {
      registry_.emplace(device_id, std::move(entry));
    }
  }
  if (raced) {
    retire(std::move(displaced));
  }

  SERIALLINK_LOG_INFO(COMPONENT, "open_port",
                      "Opened " + device_id + " @ " + std::to_string(baud_rate) + " mode=" + framer::describe(mode));
  return true;
}

void PortManager::close_port(const std::string& device_id) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(device_id);
    if (it == registry_.end()) {
      return;
    }
    if (it->second.task && it->second.task->on_task_thread()) {
      SERIALLINK_LOG_ERROR(COMPONENT, "close_port", "Refusing to close " + device_id + " from its own reader thread");
      return;
    }
    entry = std::move(it->second);
    registry_.erase(it);
  }
  retire(std::move(entry));
  SERIALLINK_LOG_INFO(COMPONENT, "close_port", "Closed " + device_id);
}

void PortManager::close_all() {
  std::vector<Entry> entries;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (auto& kv : registry_) {
      entries.push_back(std::move(kv.second));
    }
    registry_.clear();
  }
  for (auto& entry : entries) {
    retire(std::move(entry));
  }
}

bool PortManager::is_open(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return registry_.count(device_id) != 0;
}

std::vector<std::string> PortManager::open_ports() const {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    ids.reserve(registry_.size());
    for (const auto& kv : registry_) {
      ids.push_back(kv.first);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

bool PortManager::write_port(const std::string& device_id, const std::vector<uint8_t>& data) {
  auto shared = find_port(device_id);
  if (!shared) {
    SERIALLINK_LOG_ERROR(COMPONENT, "write_port", "Port not open: " + device_id);
    return false;
  }

  boost::system::error_code ec;
  {
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->port->write(boost::asio::buffer(data), ec);
  }
  if (!ec) {
    std::lock_guard<std::mutex> lock(shared->mutex);
    shared->port->flush(ec);
  }
  if (ec) {
    // The reader notices a vanished device on its next read and reports it
    if (classify_error(ec) == ErrorClass::Disconnection) {
      SERIALLINK_LOG_WARNING(COMPONENT, "write_port", "Device disconnected during write: " + device_id);
    } else {
      SERIALLINK_LOG_ERROR(COMPONENT, "write_port", "Failed to write to " + device_id + ": " + ec.message());
      error_reporting::report_system_error(COMPONENT, "write_port", "Write failed on " + device_id, ec);
    }
    return false;
  }
  return true;
}

bool PortManager::reconfigure_port(const std::string& device_id, unsigned baud_rate, unsigned data_bits, int parity,
                                   unsigned stop_bits, int flow_control, std::chrono::milliseconds timeout) {
  auto shared = find_port(device_id);
  if (!shared) {
    SERIALLINK_LOG_ERROR(COMPONENT, "reconfigure_port", "Port not open: " + device_id);
    return false;
  }

  bool ok = true;
  auto invalid = [&](const std::string& what) {
    SERIALLINK_LOG_ERROR(COMPONENT, "reconfigure_port", "Invalid " + what + " for " + device_id);
    error_reporting::report_configuration_error(COMPONENT, "reconfigure_port", "Invalid " + what);
    ok = false;
  };
  auto apply = [&](const char* what, auto&& fn) {
    boost::system::error_code ec;
    {
      std::lock_guard<std::mutex> lock(shared->mutex);
      fn(*shared->port, ec);
    }
    if (ec) {
      SERIALLINK_LOG_ERROR(COMPONENT, "reconfigure_port",
                           std::string("Failed to set ") + what + " on " + device_id + ": " + ec.message());
      error_reporting::report_system_error(COMPONENT, "reconfigure_port", std::string("Failed to set ") + what, ec);
      ok = false;
    }
  };

  using interface::SerialPortInterface;
  using Ec = boost::system::error_code;

  if (SerialConfig::valid_baud_rate(baud_rate)) {
    apply("baud rate", [&](SerialPortInterface& p, Ec& ec) { transport::apply_baud_rate(p, baud_rate, ec); });
  } else {
    invalid("baud rate " + std::to_string(baud_rate));
  }

  if (SerialConfig::valid_data_bits(data_bits)) {
    apply("data bits", [&](SerialPortInterface& p, Ec& ec) { transport::apply_data_bits(p, data_bits, ec); });
  } else {
    invalid("data bits " + std::to_string(data_bits));
  }

  if (auto p = config::parity_from_int(parity)) {
    apply("parity", [&](SerialPortInterface& port, Ec& ec) { transport::apply_parity(port, *p, ec); });
  } else {
    invalid("parity " + std::to_string(parity));
  }

  if (SerialConfig::valid_stop_bits(stop_bits)) {
    apply("stop bits", [&](SerialPortInterface& p, Ec& ec) { transport::apply_stop_bits(p, stop_bits, ec); });
  } else {
    invalid("stop bits " + std::to_string(stop_bits));
  }

  if (auto f = config::flow_from_int(flow_control)) {
    apply("flow control", [&](SerialPortInterface& port, Ec& ec) { transport::apply_flow_control(port, *f, ec); });
  } else {
    invalid("flow control " + std::to_string(flow_control));
  }

  if (SerialConfig::valid_timeout(timeout)) {
    apply("timeout", [&](SerialPortInterface& p, Ec& ec) { p.set_timeout(timeout, ec); });
  } else {
    invalid("timeout " + std::to_string(timeout.count()) + "ms");
  }

  if (ok) {
    SERIALLINK_LOG_INFO(COMPONENT, "reconfigure_port", "Reconfigured " + device_id);
  }
  return ok;
}

bool PortManager::set_delimiter(const std::string& device_id, uint8_t delimiter) {
  return set_buffering_mode(device_id, framer::CustomDelimiter{delimiter});
}

bool PortManager::set_buffering_mode(const std::string& device_id, const framer::BufferingMode& mode) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = registry_.find(device_id);
  if (it == registry_.end()) {
    return false;
  }
  it->second.mode->set(mode);
  SERIALLINK_LOG_DEBUG(COMPONENT, "set_buffering_mode", device_id + " -> " + framer::describe(mode));
  return true;
}

std::vector<PortEvent> PortManager::poll_events() {
  auto events = queue_->drain();
  for (const auto& event : events) {
    dispatch(event);
    if (std::holds_alternative<DisconnectedEvent>(event)) {
      close_if_reader_stopped(device_id_of(event));
    }
  }
  return events;
}

void PortManager::on_data_received(DataCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_data_ = std::move(callback);
}

void PortManager::on_port_disconnected(DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_disconnect_ = std::move(callback);
}

std::shared_ptr<SharedPort> PortManager::find_port(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = registry_.find(device_id);
  if (it == registry_.end()) {
    return nullptr;
  }
  return it->second.port;
}

void PortManager::retire(Entry entry) {
  if (entry.task && entry.task->on_task_thread()) {
    // Reached from host code running on this device's reader (a log or error
    // callback). The reader closes the port itself once it unwinds.
    SERIALLINK_LOG_WARNING(COMPONENT, "close_port",
                           "Deferring close of " + entry.task->device_id() + " to its reader thread");
    entry.task->abandon();
    entry.task.reset();
    return;
  }
  if (entry.task) {
    entry.task->stop();
    entry.task.reset();
  }
  if (entry.port) {
    boost::system::error_code ec;
    std::lock_guard<std::mutex> lock(entry.port->mutex);
    entry.port->port->close(ec);
    if (ec) {
      SERIALLINK_LOG_DEBUG(COMPONENT, "close_port", "Close reported: " + ec.message());
    }
  }
}

// A Disconnected event from a previous incarnation of the id must not close
// a freshly reopened device whose reader is still running.
void PortManager::close_if_reader_stopped(const std::string& device_id) {
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registry_.find(device_id);
    if (it == registry_.end() || (it->second.task && it->second.task->running())) {
      return;
    }
  }
  close_port(device_id);
}

void PortManager::dispatch(const PortEvent& event) {
  DataCallback on_data;
  DisconnectCallback on_disconnect;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_data = on_data_;
    on_disconnect = on_disconnect_;
  }

  try {
    if (auto data = std::get_if<DataEvent>(&event)) {
      if (on_data) on_data(data->device_id, data->bytes);
    } else if (auto gone = std::get_if<DisconnectedEvent>(&event)) {
      if (on_disconnect) on_disconnect(gone->device_id);
    }
  } catch (const std::exception& e) {
    SERIALLINK_LOG_ERROR(COMPONENT, "poll_events", std::string("Event callback threw: ") + e.what());
    error_reporting::report_system_error(COMPONENT, "poll_events", std::string("Event callback threw: ") + e.what());
  }
}

}  // namespace manager
}  // namespace seriallink
