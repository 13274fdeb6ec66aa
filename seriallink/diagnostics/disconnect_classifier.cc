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

#include "seriallink/diagnostics/disconnect_classifier.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace seriallink {
namespace diagnostics {

namespace errc = boost::system::errc;

namespace {

bool is_device_absent(const boost::system::error_code& ec) {
  return ec == errc::no_such_device || ec == errc::no_such_device_or_address ||
         ec == errc::no_such_file_or_directory;
}

bool is_access_revoked(const boost::system::error_code& ec) {
  return ec == errc::permission_denied || ec == errc::operation_not_permitted;
}

}  // namespace

ErrorClass classify_error(const boost::system::error_code& ec) {
  if (!ec) {
    return ErrorClass::None;
  }

  if (ec == boost::asio::error::timed_out || ec == boost::asio::error::would_block ||
      ec == boost::asio::error::try_again) {
    return ErrorClass::Transient;
  }

  if (is_device_absent(ec) || is_access_revoked(ec)) {
    return ErrorClass::Disconnection;
  }
  if (ec == boost::asio::error::broken_pipe || ec == boost::asio::error::connection_aborted ||
      ec == boost::asio::error::not_connected || ec == boost::asio::error::eof) {
    return ErrorClass::Disconnection;
  }

  return ErrorClass::Other;
}

ErrorCode to_seriallink_error_code(const boost::system::error_code& ec) {
  if (!ec) {
    return ErrorCode::Success;
  }
  if (ec == boost::asio::error::timed_out) {
    return ErrorCode::TimedOut;
  }
  if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
    return ErrorCode::WouldBlock;
  }
  if (is_device_absent(ec)) {
    return ErrorCode::DeviceNotFound;
  }
  if (is_access_revoked(ec)) {
    return ErrorCode::AccessDenied;
  }
  if (ec == boost::asio::error::not_connected) {
    return ErrorCode::NotConnected;
  }
  if (ec == boost::asio::error::broken_pipe || ec == boost::asio::error::connection_aborted ||
      ec == boost::asio::error::eof) {
    return ErrorCode::Disconnected;
  }
  if (ec == boost::asio::error::invalid_argument || ec == boost::asio::error::operation_not_supported) {
    return ErrorCode::InvalidConfiguration;
  }

  return ErrorCode::IoError;
}

std::string_view error_class_name(ErrorClass cls) {
  switch (cls) {
    case ErrorClass::None:
      return "none";
    case ErrorClass::Disconnection:
      return "disconnection";
    case ErrorClass::Transient:
      return "transient";
    case ErrorClass::Other:
      return "other";
  }
  return "unknown";
}

}  // namespace diagnostics
}  // namespace seriallink
