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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/asio/serial_port_base.hpp>
#include <chrono>

#include "mocks/mock_serial_port.hpp"
#include "seriallink/diagnostics/logger.hpp"
#include "seriallink/transport/serial/port_setup.hpp"

using namespace seriallink;
using namespace seriallink::transport;
using seriallink::test::mocks::MockSerialPort;
using ::testing::_;
using ::testing::An;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::SetArgReferee;
using ::testing::StrictMock;

using sp = boost::asio::serial_port_base;

class PortSetupTest : public ::testing::Test {
 protected:
  void SetUp() override {
    diagnostics::Logger::instance().set_console_output(false);
    cfg_.device = "/dev/ttyMOCK";
    cfg_.baud_rate = 57600;
    cfg_.data_bits = 7;
    cfg_.parity = config::SerialConfig::Parity::Even;
    cfg_.stop_bits = 2;
    cfg_.flow = config::SerialConfig::Flow::Software;
    cfg_.timeout = std::chrono::milliseconds(300);
  }

  void TearDown() override { diagnostics::Logger::instance().set_console_output(true); }

  config::SerialConfig cfg_;
};

TEST_F(PortSetupTest, OpenConfiguredAppliesEveryOptionInOrder) {
  StrictMock<MockSerialPort> port;
  {
    InSequence seq;
    EXPECT_CALL(port, open("/dev/ttyMOCK", _));
    EXPECT_CALL(port, set_option(An<const sp::baud_rate&>(), _))
        .WillOnce(Invoke([](const sp::baud_rate& o, boost::system::error_code&) { EXPECT_EQ(o.value(), 57600u); }));
    EXPECT_CALL(port, set_option(An<const sp::character_size&>(), _))
        .WillOnce(Invoke([](const sp::character_size& o, boost::system::error_code&) { EXPECT_EQ(o.value(), 7u); }));
    EXPECT_CALL(port, set_option(An<const sp::stop_bits&>(), _))
        .WillOnce(Invoke(
            [](const sp::stop_bits& o, boost::system::error_code&) { EXPECT_EQ(o.value(), sp::stop_bits::two); }));
    EXPECT_CALL(port, set_option(An<const sp::parity&>(), _))
        .WillOnce(Invoke([](const sp::parity& o, boost::system::error_code&) { EXPECT_EQ(o.value(), sp::parity::even); }));
    EXPECT_CALL(port, set_option(An<const sp::flow_control&>(), _))
        .WillOnce(Invoke([](const sp::flow_control& o, boost::system::error_code&) {
          EXPECT_EQ(o.value(), sp::flow_control::software);
        }));
    EXPECT_CALL(port, set_timeout(std::chrono::milliseconds(300), _));
  }

  boost::system::error_code ec;
  EXPECT_TRUE(open_configured(port, cfg_, ec));
  EXPECT_FALSE(ec);
}

TEST_F(PortSetupTest, OpenFailureSkipsConfiguration) {
  StrictMock<MockSerialPort> port;
  EXPECT_CALL(port, open(_, _))
      .WillOnce(SetArgReferee<1>(boost::system::error_code(boost::asio::error::access_denied)));

  boost::system::error_code ec;
  EXPECT_FALSE(open_configured(port, cfg_, ec));
  EXPECT_EQ(ec, boost::asio::error::access_denied);
}

TEST_F(PortSetupTest, OptionFailureClosesThePort) {
  NiceMock<MockSerialPort> port;
  EXPECT_CALL(port, set_option(An<const sp::parity&>(), _))
      .WillOnce(SetArgReferee<1>(boost::system::error_code(boost::asio::error::invalid_argument)));
  EXPECT_CALL(port, set_option(An<const sp::flow_control&>(), _)).Times(0);
  EXPECT_CALL(port, set_timeout(_, _)).Times(0);
  EXPECT_CALL(port, close(_)).Times(1);

  boost::system::error_code ec;
  EXPECT_FALSE(open_configured(port, cfg_, ec));
  EXPECT_EQ(ec, boost::asio::error::invalid_argument);
}

TEST_F(PortSetupTest, SingleFieldSettersMapConfigValues) {
  StrictMock<MockSerialPort> port;
  EXPECT_CALL(port, set_option(An<const sp::parity&>(), _))
      .WillOnce(Invoke([](const sp::parity& o, boost::system::error_code&) { EXPECT_EQ(o.value(), sp::parity::none); }));
  EXPECT_CALL(port, set_option(An<const sp::stop_bits&>(), _))
      .WillOnce(Invoke(
          [](const sp::stop_bits& o, boost::system::error_code&) { EXPECT_EQ(o.value(), sp::stop_bits::one); }));
  EXPECT_CALL(port, set_option(An<const sp::flow_control&>(), _))
      .WillOnce(Invoke([](const sp::flow_control& o, boost::system::error_code&) {
        EXPECT_EQ(o.value(), sp::flow_control::hardware);
      }));

  boost::system::error_code ec;
  apply_parity(port, config::SerialConfig::Parity::None, ec);
  apply_stop_bits(port, 1, ec);
  apply_flow_control(port, config::SerialConfig::Flow::Hardware, ec);
  EXPECT_FALSE(ec);
}
