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

#include "seriallink/transport/serial/boost_serial_port.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <cerrno>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <termios.h>
#endif

namespace seriallink {
namespace transport {

namespace net = boost::asio;

namespace {

#ifdef _WIN32
boost::system::error_code last_system_error() {
  return boost::system::error_code(static_cast<int>(::GetLastError()), boost::system::system_category());
}
#else
boost::system::error_code last_system_error() {
  return boost::system::error_code(errno, boost::system::system_category());
}
#endif

}  // namespace

BoostSerialPort::BoostSerialPort() : port_(ioc_) {}

BoostSerialPort::~BoostSerialPort() {
  boost::system::error_code ignored;
  close(ignored);
}

void BoostSerialPort::open(const std::string& device, boost::system::error_code& ec) { port_.open(device, ec); }

bool BoostSerialPort::is_open() const { return port_.is_open(); }

void BoostSerialPort::close(boost::system::error_code& ec) {
  ec.clear();
  if (port_.is_open()) {
    port_.close(ec);
  }
}

void BoostSerialPort::set_option(const net::serial_port_base::baud_rate& option, boost::system::error_code& ec) {
  port_.set_option(option, ec);
}

void BoostSerialPort::set_option(const net::serial_port_base::character_size& option, boost::system::error_code& ec) {
  port_.set_option(option, ec);
}

void BoostSerialPort::set_option(const net::serial_port_base::stop_bits& option, boost::system::error_code& ec) {
  port_.set_option(option, ec);
}

void BoostSerialPort::set_option(const net::serial_port_base::parity& option, boost::system::error_code& ec) {
  port_.set_option(option, ec);
}

void BoostSerialPort::set_option(const net::serial_port_base::flow_control& option, boost::system::error_code& ec) {
  port_.set_option(option, ec);
}

void BoostSerialPort::set_timeout(std::chrono::milliseconds timeout, boost::system::error_code& ec) {
  if (timeout.count() < 0) {
    ec = net::error::invalid_argument;
    return;
  }
  ec.clear();
  timeout_ = timeout;
}

std::size_t BoostSerialPort::read_some(const net::mutable_buffer& buffer, boost::system::error_code& ec) {
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return 0;
  }

  bool done = false;
  std::size_t transferred = 0;
  boost::system::error_code result;
  port_.async_read_some(buffer, [&](const boost::system::error_code& e, std::size_t n) {
    result = e;
    transferred = n;
    done = true;
  });

  ioc_.restart();
  if (timeout_.count() > 0) {
    ioc_.run_for(timeout_);
  } else {
    ioc_.poll();
  }

  bool timed_out = false;
  if (!done) {
    // Let the cancelled handler run so nothing refers to this frame afterwards
    boost::system::error_code ignored;
    port_.cancel(ignored);
    ioc_.restart();
    ioc_.run();
    timed_out = !done || result == net::error::operation_aborted;
  }

  if (timed_out) {
    ec = timeout_.count() > 0 ? make_error_code(net::error::timed_out) : make_error_code(net::error::would_block);
    return 0;
  }

  ec = result;
  return transferred;
}

std::size_t BoostSerialPort::write(const net::const_buffer& buffer, boost::system::error_code& ec) {
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return 0;
  }
  return net::write(port_, buffer, ec);
}

void BoostSerialPort::flush(boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return;
  }
#ifdef _WIN32
  if (!::FlushFileBuffers(port_.native_handle())) ec = last_system_error();
#else
  if (::tcdrain(port_.native_handle()) != 0) ec = last_system_error();
#endif
}

std::size_t BoostSerialPort::bytes_available(boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return 0;
  }
#ifdef _WIN32
  COMSTAT status{};
  DWORD errors = 0;
  if (!::ClearCommError(port_.native_handle(), &errors, &status)) {
    ec = last_system_error();
    return 0;
  }
  return static_cast<std::size_t>(status.cbInQue);
#else
  int available = 0;
  if (::ioctl(port_.native_handle(), FIONREAD, &available) != 0) {
    ec = last_system_error();
    return 0;
  }
  return available > 0 ? static_cast<std::size_t>(available) : 0;
#endif
}

void BoostSerialPort::clear(boost::system::error_code& ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = net::error::bad_descriptor;
    return;
  }
#ifdef _WIN32
  if (!::PurgeComm(port_.native_handle(), PURGE_RXCLEAR | PURGE_TXCLEAR)) ec = last_system_error();
#else
  if (::tcflush(port_.native_handle(), TCIOFLUSH) != 0) ec = last_system_error();
#endif
}

interface::SerialPortFactory default_port_factory() {
  return []() -> std::unique_ptr<interface::SerialPortInterface> { return std::make_unique<BoostSerialPort>(); };
}

}  // namespace transport
}  // namespace seriallink
