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

#include "seriallink/base/visibility.hpp"
#include "seriallink/config/serial_config.hpp"
#include "seriallink/interface/iserial_port.hpp"

namespace seriallink {
namespace transport {

using config::SerialConfig;
using interface::SerialPortInterface;

// Single-field setters, each one system call on an open port.
SERIALLINK_API void apply_baud_rate(SerialPortInterface& port, unsigned baud, boost::system::error_code& ec);
SERIALLINK_API void apply_data_bits(SerialPortInterface& port, unsigned bits, boost::system::error_code& ec);
SERIALLINK_API void apply_parity(SerialPortInterface& port, SerialConfig::Parity parity,
                                 boost::system::error_code& ec);
SERIALLINK_API void apply_stop_bits(SerialPortInterface& port, unsigned bits, boost::system::error_code& ec);
SERIALLINK_API void apply_flow_control(SerialPortInterface& port, SerialConfig::Flow flow,
                                       boost::system::error_code& ec);

/**
 * @brief Open cfg.device and apply every field of cfg.
 *
 * Stops at the first failing step, logs it and closes the port again, so a
 * failed call never leaves a half-configured handle open.
 *
 * @return true when the port is open and fully configured
 */
SERIALLINK_API bool open_configured(SerialPortInterface& port, const SerialConfig& cfg,
                                    boost::system::error_code& ec);

}  // namespace transport
}  // namespace seriallink
