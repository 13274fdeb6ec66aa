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

#include "seriallink/session/serial_session.hpp"

#include <boost/asio/buffer.hpp>
#include <utility>

#include "seriallink/base/constants.hpp"
#include "seriallink/diagnostics/disconnect_classifier.hpp"
#include "seriallink/diagnostics/error_handler.hpp"
#include "seriallink/diagnostics/logger.hpp"
#include "seriallink/transport/serial/port_setup.hpp"

namespace seriallink {
namespace session {

using diagnostics::classify_error;
using diagnostics::ErrorClass;
namespace error_reporting = diagnostics::error_reporting;

namespace {

constexpr const char* COMPONENT = "session";

// Strict UTF-8: rejects overlong forms, surrogates and code points above U+10FFFF
bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    uint8_t c = bytes[i];
    size_t extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= n) return false;
    for (size_t k = 1; k <= extra; ++k) {
      uint8_t cc = bytes[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += extra + 1;
  }
  return true;
}

}  // namespace

SerialSession::SerialSession(SerialPortFactory factory) : factory_(std::move(factory)) {}

SerialSession::~SerialSession() {
  std::lock_guard<std::mutex> lock(mutex_);
  close_locked();
}

std::vector<discovery::PortInfo> SerialSession::list_ports() { return discovery::list_ports(); }

bool SerialSession::set_port(const std::string& device) {
  if (device.empty()) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_port", "Port name must not be empty");
    error_reporting::report_configuration_error(COMPONENT, "set_port", "Empty port name");
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.device = device;
  return true;
}

bool SerialSession::set_baud_rate(unsigned baud_rate) {
  if (!SerialConfig::valid_baud_rate(baud_rate)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_baud_rate", "Invalid baud rate: " + std::to_string(baud_rate));
    error_reporting::report_configuration_error(COMPONENT, "set_baud_rate",
                                                "Baud rate out of range: " + std::to_string(baud_rate));
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.baud_rate = baud_rate;
  return true;
}

bool SerialSession::set_data_bits(unsigned data_bits) {
  if (!SerialConfig::valid_data_bits(data_bits)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_data_bits", "Data bits must be between 6 and 8");
    error_reporting::report_configuration_error(COMPONENT, "set_data_bits",
                                                "Invalid data bits: " + std::to_string(data_bits));
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.data_bits = data_bits;
  return true;
}

bool SerialSession::set_parity(SerialConfig::Parity parity) {
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.parity = parity;
  return true;
}

bool SerialSession::set_parity(int parity) {
  auto value = config::parity_from_int(parity);
  if (!value) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_parity", "Parity must be 0 (none), 1 (odd) or 2 (even)");
    error_reporting::report_configuration_error(COMPONENT, "set_parity", "Invalid parity: " + std::to_string(parity));
    return false;
  }
  return set_parity(*value);
}

bool SerialSession::set_parity(bool enabled) {
  return set_parity(enabled ? SerialConfig::Parity::Odd : SerialConfig::Parity::None);
}

bool SerialSession::set_stop_bits(unsigned stop_bits) {
  if (!SerialConfig::valid_stop_bits(stop_bits)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_stop_bits", "Stop bits must be between 1 and 2");
    error_reporting::report_configuration_error(COMPONENT, "set_stop_bits",
                                                "Invalid stop bits: " + std::to_string(stop_bits));
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.stop_bits = stop_bits;
  return true;
}

bool SerialSession::set_flow_control(SerialConfig::Flow flow) {
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.flow = flow;
  return true;
}

bool SerialSession::set_flow_control(int flow) {
  auto value = config::flow_from_int(flow);
  if (!value) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_flow_control", "Flow control must be 0 (none), 1 (software) or 2 (hardware)");
    error_reporting::report_configuration_error(COMPONENT, "set_flow_control",
                                                "Invalid flow control: " + std::to_string(flow));
    return false;
  }
  return set_flow_control(*value);
}

bool SerialSession::set_timeout(std::chrono::milliseconds timeout) {
  if (!SerialConfig::valid_timeout(timeout)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "set_timeout", "Invalid timeout: " + std::to_string(timeout.count()) + "ms");
    error_reporting::report_configuration_error(COMPONENT, "set_timeout",
                                                "Timeout out of range: " + std::to_string(timeout.count()));
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.timeout = timeout;
  return true;
}

SerialConfig SerialSession::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cfg_;
}

bool SerialSession::open() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (cfg_.device.empty()) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open", "Port name not set");
    error_reporting::report_configuration_error(COMPONENT, "open", "Port name not set");
    return false;
  }

  if (port_) {
    SERIALLINK_LOG_DEBUG(COMPONENT, "open", "Closing previous connection to reopen " + cfg_.device);
    close_locked();
  }

  auto port = factory_();
  if (!port) {
    SERIALLINK_LOG_ERROR(COMPONENT, "open", "Port factory returned no handle");
    error_reporting::report_system_error(COMPONENT, "open", "Port factory returned no handle");
    return false;
  }

  boost::system::error_code ec;
  if (!transport::open_configured(*port, cfg_, ec)) {
    error_reporting::report_connectivity_error(COMPONENT, "open", ec);
    return false;
  }

  port_ = std::move(port);
  connected_ = true;
  SERIALLINK_LOG_INFO(COMPONENT, "open", "Session opened on " + cfg_.device);
  return true;
}

void SerialSession::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  close_locked();
}

bool SerialSession::is_open() {
  std::lock_guard<std::mutex> lock(mutex_);
  return probe_locked();
}

bool SerialSession::write(const std::vector<uint8_t>& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_locked(data.data(), data.size());
}

bool SerialSession::write_text(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_locked(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool SerialSession::write_line(const std::string& text) {
  std::string line = text;
  line.push_back(constants::LINE_FEED);
  return write_text(line);
}

std::vector<uint8_t> SerialSession::read(size_t max_size) {
  if (max_size > constants::MAX_READ_SIZE) {
    SERIALLINK_LOG_ERROR(COMPONENT, "read", "Read size too large: " + std::to_string(max_size));
    error_reporting::report_configuration_error(COMPONENT, "read", "Read size exceeds limit");
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!probe_locked()) {
    return {};
  }

  std::vector<uint8_t> buffer(max_size);
  if (max_size == 0) {
    return buffer;
  }

  boost::system::error_code ec;
  size_t n = port_->read_some(boost::asio::buffer(buffer), ec);
  if (ec) {
    switch (classify_error(ec)) {
      case ErrorClass::Transient:
        break;
      case ErrorClass::Disconnection:
        teardown_locked("read", ec);
        break;
      default:
        SERIALLINK_LOG_ERROR(COMPONENT, "read", "Failed to read from port: " + ec.message());
        error_reporting::report_system_error(COMPONENT, "read", "Read failed", ec);
        break;
    }
    return {};
  }

  buffer.resize(n);
  if (n > 0) {
    SERIALLINK_LOG_DEBUG(COMPONENT, "read", "Read " + diagnostics::hex_preview(buffer.data(), n));
  }
  return buffer;
}

std::string SerialSession::read_text(size_t max_size) {
  auto bytes = read(max_size);
  if (!is_valid_utf8(bytes)) {
    SERIALLINK_LOG_ERROR(COMPONENT, "read_text",
                         "Failed to convert " + std::to_string(bytes.size()) + " bytes to string: invalid UTF-8");
    error_reporting::report_protocol_error(COMPONENT, "read_text", "Received bytes are not valid UTF-8");
    return {};
  }
  return std::string(bytes.begin(), bytes.end());
}

std::string SerialSession::readline() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!probe_locked()) {
    return {};
  }

  std::string line;
  uint8_t byte = 0;
  while (true) {
    boost::system::error_code ec;
    size_t n = port_->read_some(boost::asio::buffer(&byte, 1), ec);
    if (ec) {
      ErrorClass cls = classify_error(ec);
      if (cls == ErrorClass::Transient) {
        break;
      }
      if (cls == ErrorClass::Disconnection) {
        teardown_locked("readline", ec);
      } else {
        error_reporting::report_system_error(COMPONENT, "readline", "Read failed", ec);
      }
      if (line.empty()) {
        SERIALLINK_LOG_ERROR(COMPONENT, "readline", "Failed to read line: " + ec.message());
      }
      break;
    }
    if (n == 0) {
      break;
    }
    if (byte == constants::LINE_FEED) {
      break;
    }
    if (byte != constants::CARRIAGE_RETURN) {
      line.push_back(static_cast<char>(byte));
    }
  }
  return line;
}

size_t SerialSession::bytes_available() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!probe_locked()) {
    return 0;
  }

  boost::system::error_code ec;
  size_t n = port_->bytes_available(ec);
  if (ec) {
    if (classify_error(ec) == ErrorClass::Disconnection) {
      teardown_locked("bytes_available", ec);
    } else {
      SERIALLINK_LOG_ERROR(COMPONENT, "bytes_available", "Failed to query input buffer: " + ec.message());
    }
    return 0;
  }
  return n;
}

bool SerialSession::clear_buffer() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!probe_locked()) {
    return false;
  }

  boost::system::error_code ec;
  port_->clear(ec);
  if (ec) {
    if (classify_error(ec) == ErrorClass::Disconnection) {
      teardown_locked("clear_buffer", ec);
    } else {
      SERIALLINK_LOG_ERROR(COMPONENT, "clear_buffer", "Failed to clear buffers: " + ec.message());
      error_reporting::report_system_error(COMPONENT, "clear_buffer", "Clear failed", ec);
    }
    return false;
  }
  return true;
}

bool SerialSession::probe_locked() {
  if (!port_) {
    return false;
  }

  boost::system::error_code ec;
  port_->bytes_available(ec);
  if (ec && classify_error(ec) == ErrorClass::Disconnection) {
    SERIALLINK_LOG_INFO(COMPONENT, "probe", "Connection test failed: " + ec.message() + " - marking as disconnected");
    teardown_locked("probe", ec);
    return false;
  }
  connected_ = true;
  return connected_;
}

bool SerialSession::write_locked(const uint8_t* data, size_t size) {
  if (!probe_locked()) {
    SERIALLINK_LOG_ERROR(COMPONENT, "write", "Port not connected");
    return false;
  }

  boost::system::error_code ec;
  port_->write(boost::asio::buffer(data, size), ec);
  const char* step = "write";
  if (!ec) {
    port_->flush(ec);
    step = "flush";
  }
  if (!ec) {
    return true;
  }

  if (classify_error(ec) == ErrorClass::Disconnection) {
    teardown_locked(step, ec);
  } else {
    SERIALLINK_LOG_ERROR(COMPONENT, step, std::string("Failed to ") + step + " port: " + ec.message());
    error_reporting::report_system_error(COMPONENT, step, "Write failed", ec);
  }
  return false;
}

void SerialSession::teardown_locked(const char* operation, const boost::system::error_code& ec) {
  if (!port_) {
    return;
  }
  SERIALLINK_LOG_WARNING(COMPONENT, operation, "Device disconnected, closing port " + cfg_.device);
  error_reporting::report_connectivity_error(COMPONENT, operation, ec);
  close_locked();
}

void SerialSession::close_locked() {
  if (port_) {
    boost::system::error_code ec;
    port_->close(ec);
    if (ec) {
      SERIALLINK_LOG_DEBUG(COMPONENT, "close", "Close reported: " + ec.message());
    }
    port_.reset();
  }
  connected_ = false;
}

}  // namespace session
}  // namespace seriallink
