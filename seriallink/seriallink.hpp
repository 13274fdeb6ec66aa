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

#include "seriallink/base/constants.hpp"
#include "seriallink/base/error_codes.hpp"
#include "seriallink/base/visibility.hpp"

// Configuration
#include "seriallink/config/config_loader.hpp"
#include "seriallink/config/manager_config.hpp"
#include "seriallink/config/serial_config.hpp"

// Error handling and logging
#include "seriallink/diagnostics/disconnect_classifier.hpp"
#include "seriallink/diagnostics/error_handler.hpp"
#include "seriallink/diagnostics/logger.hpp"

#include "seriallink/discovery/port_info.hpp"
#include "seriallink/framer/buffering_framer.hpp"
#include "seriallink/framer/buffering_mode.hpp"

// Host-facing APIs
#include "seriallink/manager/port_manager.hpp"
#include "seriallink/session/serial_session.hpp"

namespace seriallink {

using config::ManagerConfig;
using config::SerialConfig;
using manager::PortEvent;
using manager::PortManager;
using session::SerialSession;

}  // namespace seriallink
