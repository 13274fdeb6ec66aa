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

#include "seriallink/transport/serial/port_setup.hpp"

#include <boost/asio/error.hpp>
#include <string>

#include "seriallink/diagnostics/logger.hpp"

namespace seriallink {
namespace transport {

namespace net = boost::asio;

void apply_baud_rate(SerialPortInterface& port, unsigned baud, boost::system::error_code& ec) {
  port.set_option(net::serial_port_base::baud_rate(baud), ec);
}

void apply_data_bits(SerialPortInterface& port, unsigned bits, boost::system::error_code& ec) {
  port.set_option(net::serial_port_base::character_size(bits), ec);
}

void apply_parity(SerialPortInterface& port, SerialConfig::Parity parity, boost::system::error_code& ec) {
  using pa = net::serial_port_base::parity;
  pa::type p = pa::none;
  if (parity == SerialConfig::Parity::Even)
    p = pa::even;
  else if (parity == SerialConfig::Parity::Odd)
    p = pa::odd;
  port.set_option(pa(p), ec);
}

void apply_stop_bits(SerialPortInterface& port, unsigned bits, boost::system::error_code& ec) {
  using sb = net::serial_port_base::stop_bits;
  port.set_option(sb(bits == 2 ? sb::two : sb::one), ec);
}

void apply_flow_control(SerialPortInterface& port, SerialConfig::Flow flow, boost::system::error_code& ec) {
  using fc = net::serial_port_base::flow_control;
  fc::type f = fc::none;
  if (flow == SerialConfig::Flow::Software)
    f = fc::software;
  else if (flow == SerialConfig::Flow::Hardware)
    f = fc::hardware;
  port.set_option(fc(f), ec);
}

bool open_configured(SerialPortInterface& port, const SerialConfig& cfg, boost::system::error_code& ec) {
  port.open(cfg.device, ec);
  if (ec) {
    SERIALLINK_LOG_ERROR("transport", "open", "Failed to open device: " + cfg.device + " - " + ec.message());
    return false;
  }

  auto fail = [&](const char* what) {
    SERIALLINK_LOG_ERROR("transport", "configure",
                         std::string("Failed to set ") + what + " on " + cfg.device + " - " + ec.message());
    boost::system::error_code ignored;
    port.close(ignored);
    return false;
  };

  apply_baud_rate(port, cfg.baud_rate, ec);
  if (ec) return fail("baud rate");

  apply_data_bits(port, cfg.data_bits, ec);
  if (ec) return fail("character size");

  apply_stop_bits(port, cfg.stop_bits, ec);
  if (ec) return fail("stop bits");

  apply_parity(port, cfg.parity, ec);
  if (ec) return fail("parity");

  apply_flow_control(port, cfg.flow, ec);
  if (ec) return fail("flow control");

  port.set_timeout(cfg.timeout, ec);
  if (ec) return fail("timeout");

  SERIALLINK_LOG_INFO("transport", "open", "Device opened: " + config::describe(cfg));
  return true;
}

}  // namespace transport
}  // namespace seriallink
