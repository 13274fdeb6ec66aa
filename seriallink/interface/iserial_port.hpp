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

#include <boost/asio/buffer.hpp>
#include <boost/asio/serial_port_base.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace seriallink {
namespace interface {

namespace net = boost::asio;

/**
 * @brief The capability set seriallink needs from one OS serial connection.
 *
 * Every call is synchronous and reports failure through the error_code out
 * parameter; none of them throw. read_some() blocks for at most the timeout
 * set with set_timeout() and reports boost::asio::error::timed_out when no
 * byte arrived in time (would_block for a zero timeout). Implementations are
 * not thread-safe; callers serialize access.
 */
class SerialPortInterface {
 public:
  virtual ~SerialPortInterface() = default;

  virtual void open(const std::string& device, boost::system::error_code& ec) = 0;
  virtual bool is_open() const = 0;
  virtual void close(boost::system::error_code& ec) = 0;

  virtual void set_option(const net::serial_port_base::baud_rate& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::character_size& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::stop_bits& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::parity& option, boost::system::error_code& ec) = 0;
  virtual void set_option(const net::serial_port_base::flow_control& option, boost::system::error_code& ec) = 0;
  virtual void set_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec) = 0;

  virtual std::size_t read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) = 0;

  /**
   * @brief Write the whole buffer
   * @return Bytes written before completion or failure
   */
  virtual std::size_t write(const net::const_buffer& buffer, boost::system::error_code& ec) = 0;

  /**
   * @brief Block until queued output has been transmitted
   */
  virtual void flush(boost::system::error_code& ec) = 0;

  /**
   * @brief Bytes waiting in the input buffer. Non-destructive; used as the liveness probe.
   */
  virtual std::size_t bytes_available(boost::system::error_code& ec) = 0;

  /**
   * @brief Discard both input and output buffers
   */
  virtual void clear(boost::system::error_code& ec) = 0;
};

/**
 * @brief Produces fresh, unopened port handles
 */
using SerialPortFactory = std::function<std::unique_ptr<SerialPortInterface>()>;

}  // namespace interface
}  // namespace seriallink
