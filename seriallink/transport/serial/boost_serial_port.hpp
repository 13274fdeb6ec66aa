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

#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include <chrono>

#include "seriallink/base/constants.hpp"
#include "seriallink/base/visibility.hpp"
#include "seriallink/interface/iserial_port.hpp"

namespace seriallink {
namespace transport {

/**
 * @brief SerialPortInterface over boost::asio::serial_port.
 *
 * Each instance runs its own private io_context on the calling thread, which
 * is how the bounded read is implemented: an async_read_some raced against
 * io_context::run_for() and cancelled when the timeout expires.
 */
class SERIALLINK_API BoostSerialPort : public interface::SerialPortInterface {
 public:
  BoostSerialPort();
  ~BoostSerialPort() override;

  void open(const std::string& device, boost::system::error_code& ec) override;
  bool is_open() const override;
  void close(boost::system::error_code& ec) override;

  void set_option(const interface::net::serial_port_base::baud_rate& option, boost::system::error_code& ec) override;
  void set_option(const interface::net::serial_port_base::character_size& option,
                  boost::system::error_code& ec) override;
  void set_option(const interface::net::serial_port_base::stop_bits& option, boost::system::error_code& ec) override;
  void set_option(const interface::net::serial_port_base::parity& option, boost::system::error_code& ec) override;
  void set_option(const interface::net::serial_port_base::flow_control& option,
                  boost::system::error_code& ec) override;
  void set_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec) override;

  std::size_t read_some(const interface::net::mutable_buffer& buffer, boost::system::error_code& ec) override;
  std::size_t write(const interface::net::const_buffer& buffer, boost::system::error_code& ec) override;
  void flush(boost::system::error_code& ec) override;
  std::size_t bytes_available(boost::system::error_code& ec) override;
  void clear(boost::system::error_code& ec) override;

 private:
  boost::asio::io_context ioc_;
  boost::asio::serial_port port_;
  std::chrono::milliseconds timeout_{constants::DEFAULT_TIMEOUT_MS};
};

/**
 * @brief Default factory used by sessions and the port manager
 */
SERIALLINK_API interface::SerialPortFactory default_port_factory();

}  // namespace transport
}  // namespace seriallink
