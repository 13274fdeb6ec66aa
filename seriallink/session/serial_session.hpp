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
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "seriallink/base/visibility.hpp"
#include "seriallink/config/serial_config.hpp"
#include "seriallink/discovery/port_info.hpp"
#include "seriallink/interface/iserial_port.hpp"
#include "seriallink/transport/serial/boost_serial_port.hpp"

namespace seriallink {
namespace session {

using config::SerialConfig;
using interface::SerialPortFactory;
using interface::SerialPortInterface;

/**
 * @brief A single serial connection driven synchronously by the host.
 *
 * The cached connected flag is never trusted on its own: every I/O call
 * first probes the transport with a non-destructive bytes-available query,
 * and any error classified as a disconnection tears the session down.
 * Failures are reported as false / empty / zero return values plus a log
 * entry; nothing throws. All members are serialized by an internal mutex.
 *
 * Setters validate and store; they take effect on the next open().
 */
class SERIALLINK_API SerialSession {
 public:
  explicit SerialSession(SerialPortFactory factory = transport::default_port_factory());
  ~SerialSession();

  SerialSession(const SerialSession&) = delete;
  SerialSession& operator=(const SerialSession&) = delete;

  static std::vector<discovery::PortInfo> list_ports();

  bool set_port(const std::string& device);
  bool set_baud_rate(unsigned baud_rate);
  bool set_data_bits(unsigned data_bits);
  bool set_parity(SerialConfig::Parity parity);
  // 0=None 1=Odd 2=Even
  bool set_parity(int parity);
  // false=None true=Odd
  bool set_parity(bool enabled);
  bool set_stop_bits(unsigned stop_bits);
  bool set_flow_control(SerialConfig::Flow flow);
  // 0=None 1=Software 2=Hardware
  bool set_flow_control(int flow);
  bool set_timeout(std::chrono::milliseconds timeout);

  SerialConfig config() const;

  bool open();
  void close();

  /**
   * @brief Actively probes the transport
   */
  bool is_open();

  bool write(const std::vector<uint8_t>& data);
  bool write_text(const std::string& text);
  bool write_line(const std::string& text);

  std::vector<uint8_t> read(size_t max_size);

  /**
   * @brief read() decoded as UTF-8; invalid input yields an empty string
   */
  std::string read_text(size_t max_size);

  /**
   * @brief Read up to the next LF, dropping CR.
   *
   * A timeout, an empty read or an error ends the line early; whatever was
   * collected so far is returned.
   */
  std::string readline();

  size_t bytes_available();
  bool clear_buffer();

 private:
  bool probe_locked();
  bool write_locked(const uint8_t* data, size_t size);
  void teardown_locked(const char* operation, const boost::system::error_code& ec);
  void close_locked();

  mutable std::mutex mutex_;
  SerialPortFactory factory_;
  SerialConfig cfg_;
  std::unique_ptr<SerialPortInterface> port_;
  bool connected_ = false;
};

}  // namespace session
}  // namespace seriallink
