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
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>

#include "mocks/fake_serial_port.hpp"
#include "mocks/mock_serial_port.hpp"
#include "seriallink/base/constants.hpp"
#include "seriallink/diagnostics/error_handler.hpp"
#include "seriallink/diagnostics/logger.hpp"
#include "seriallink/session/serial_session.hpp"
#include "utils/test_utils.hpp"

using namespace seriallink;
using namespace seriallink::session;
using seriallink::diagnostics::ErrorCategory;
using seriallink::diagnostics::ErrorHandler;
using seriallink::test::TestUtils;
using seriallink::test::mocks::FakeDevice;
using seriallink::test::mocks::FakeDeviceBank;
using seriallink::test::mocks::MockSerialPort;
using ::testing::_;
using ::testing::An;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

constexpr const char* kDevice = "/dev/ttyFAKE0";

boost::system::error_code sys(int value) { return boost::system::error_code(value, boost::system::system_category()); }

}  // namespace

class SerialSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    diagnostics::Logger::instance().set_console_output(false);
    ErrorHandler::instance().reset_stats();
    session_ = std::make_unique<SerialSession>(bank_.factory());
    device_ = bank_.device(kDevice);
  }

  void TearDown() override {
    session_.reset();
    ErrorHandler::instance().reset_stats();
    diagnostics::Logger::instance().set_console_output(true);
  }

  void openSession() {
    ASSERT_TRUE(session_->set_port(kDevice));
    ASSERT_TRUE(session_->open());
  }

  size_t sessionErrors(ErrorCategory category) {
    return ErrorHandler::instance().get_error_count("session", category);
  }

  FakeDeviceBank bank_;
  std::shared_ptr<FakeDevice> device_;
  std::unique_ptr<SerialSession> session_;
};

TEST_F(SerialSessionTest, OpenWithoutPortFails) {
  EXPECT_FALSE(session_->open());
  EXPECT_FALSE(session_->is_open());
  EXPECT_EQ(bank_.ports_created(), 0);
  EXPECT_EQ(sessionErrors(ErrorCategory::CONFIGURATION), 1u);
}

TEST_F(SerialSessionTest, OpenAppliesStoredConfiguration) {
  using boost::asio::serial_port_base;
  ASSERT_TRUE(session_->set_port(kDevice));
  EXPECT_TRUE(session_->set_baud_rate(115200));
  EXPECT_TRUE(session_->set_data_bits(7));
  EXPECT_TRUE(session_->set_parity(2));
  EXPECT_TRUE(session_->set_stop_bits(2));
  EXPECT_TRUE(session_->set_flow_control(2));
  EXPECT_TRUE(session_->set_timeout(std::chrono::milliseconds(250)));
  ASSERT_TRUE(session_->open());

  EXPECT_TRUE(session_->is_open());
  EXPECT_EQ(device_->get(&FakeDevice::baud_rate), 115200u);
  EXPECT_EQ(device_->get(&FakeDevice::character_size), 7u);
  EXPECT_EQ(device_->get(&FakeDevice::parity), serial_port_base::parity::even);
  EXPECT_EQ(device_->get(&FakeDevice::stop_bits), serial_port_base::stop_bits::two);
  EXPECT_EQ(device_->get(&FakeDevice::flow), serial_port_base::flow_control::hardware);
  EXPECT_EQ(device_->get(&FakeDevice::timeout), std::chrono::milliseconds(250));
}

TEST_F(SerialSessionTest, BooleanParityMeansOdd) {
  EXPECT_TRUE(session_->set_parity(true));
  EXPECT_EQ(session_->config().parity, SerialConfig::Parity::Odd);
  EXPECT_TRUE(session_->set_parity(false));
  EXPECT_EQ(session_->config().parity, SerialConfig::Parity::None);
}

TEST_F(SerialSessionTest, InvalidSettersKeepPreviousValues) {
  ASSERT_TRUE(session_->set_data_bits(7));
  EXPECT_FALSE(session_->set_data_bits(9));
  EXPECT_FALSE(session_->set_data_bits(5));
  EXPECT_FALSE(session_->set_baud_rate(0));
  EXPECT_FALSE(session_->set_parity(3));
  EXPECT_FALSE(session_->set_stop_bits(3));
  EXPECT_FALSE(session_->set_flow_control(-1));
  EXPECT_FALSE(session_->set_timeout(std::chrono::milliseconds(-1)));
  EXPECT_FALSE(session_->set_port(""));

  auto cfg = session_->config();
  EXPECT_EQ(cfg.data_bits, 7u);
  EXPECT_EQ(cfg.baud_rate, constants::DEFAULT_BAUD_RATE);
  EXPECT_EQ(cfg.parity, SerialConfig::Parity::None);
  EXPECT_EQ(cfg.stop_bits, 1u);
  EXPECT_EQ(cfg.flow, SerialConfig::Flow::None);
  EXPECT_TRUE(cfg.device.empty());
  EXPECT_EQ(sessionErrors(ErrorCategory::CONFIGURATION), 8u);
}

TEST_F(SerialSessionTest, SettersTakeEffectOnNextOpen) {
  ASSERT_TRUE(session_->set_baud_rate(115200));
  openSession();
  EXPECT_TRUE(session_->set_baud_rate(19200));
  EXPECT_EQ(device_->get(&FakeDevice::baud_rate), 115200u);

  ASSERT_TRUE(session_->open());
  EXPECT_EQ(device_->get(&FakeDevice::baud_rate), 19200u);
  EXPECT_EQ(device_->get(&FakeDevice::close_count), 1);
  EXPECT_EQ(bank_.ports_created(), 2);
}

TEST_F(SerialSessionTest, OpenFailureIsReported) {
  device_->open_error = sys(ENOENT);
  ASSERT_TRUE(session_->set_port(kDevice));
  EXPECT_FALSE(session_->open());
  EXPECT_FALSE(session_->is_open());
  EXPECT_EQ(sessionErrors(ErrorCategory::CONNECTIVITY), 1u);
}

TEST_F(SerialSessionTest, OptionFailureClosesTheDevice) {
  device_->baud_error = sys(EINVAL);
  ASSERT_TRUE(session_->set_port(kDevice));
  EXPECT_FALSE(session_->open());
  EXPECT_FALSE(device_->get(&FakeDevice::open));
  EXPECT_EQ(device_->get(&FakeDevice::close_count), 1);
}

TEST_F(SerialSessionTest, WriteLineAppendsLineFeedAndFlushes) {
  openSession();
  EXPECT_TRUE(session_->write_line("AT"));
  EXPECT_TRUE(session_->write(TestUtils::bytes("+OK")));
  EXPECT_EQ(device_->written_text(), "AT\n+OK");
  EXPECT_EQ(device_->get(&FakeDevice::flush_count), 2);
}

TEST_F(SerialSessionTest, WriteWhenClosedFails) {
  EXPECT_FALSE(session_->write_text("data"));
  EXPECT_EQ(device_->get(&FakeDevice::write_count), 0);
}

TEST_F(SerialSessionTest, DisconnectionOnWriteClearsSession) {
  openSession();
  device_->write_error = boost::asio::error::broken_pipe;
  EXPECT_FALSE(session_->write_text("data"));
  EXPECT_EQ(device_->get(&FakeDevice::close_count), 1);
  EXPECT_FALSE(session_->is_open());
  EXPECT_EQ(sessionErrors(ErrorCategory::CONNECTIVITY), 1u);
}

TEST_F(SerialSessionTest, OtherWriteErrorKeepsSessionOpen) {
  openSession();
  device_->flush_error = sys(EIO);
  EXPECT_FALSE(session_->write_text("data"));
  EXPECT_TRUE(session_->is_open());
  EXPECT_EQ(sessionErrors(ErrorCategory::SYSTEM), 1u);
}

TEST_F(SerialSessionTest, ProbeDetectsUnplug) {
  openSession();
  EXPECT_TRUE(session_->is_open());

  device_->set_probe_error(sys(ENXIO));
  EXPECT_FALSE(session_->is_open());
  EXPECT_FALSE(device_->get(&FakeDevice::open));

  // Closed sessions report closed without touching the device again
  int probes = device_->get(&FakeDevice::probe_count);
  EXPECT_FALSE(session_->is_open());
  EXPECT_EQ(device_->get(&FakeDevice::probe_count), probes);
}

TEST_F(SerialSessionTest, ProbeIgnoresNonDisconnectionErrors) {
  openSession();
  device_->set_probe_error(sys(EIO));
  EXPECT_TRUE(session_->is_open());
}

TEST_F(SerialSessionTest, ReadReturnsAvailableBytes) {
  openSession();
  device_->push_read("hello");
  EXPECT_EQ(TestUtils::text(session_->read(3)), "hel");
  EXPECT_EQ(TestUtils::text(session_->read(16)), "lo");
}

TEST_F(SerialSessionTest, ReadTimeoutReturnsEmptyAndStaysOpen) {
  openSession();
  EXPECT_TRUE(session_->read(16).empty());
  EXPECT_TRUE(session_->is_open());
}

TEST_F(SerialSessionTest, ReadDisconnectionClosesSession) {
  openSession();
  device_->push_read_error(boost::asio::error::eof);
  EXPECT_TRUE(session_->read(16).empty());
  EXPECT_FALSE(session_->is_open());
  EXPECT_TRUE(session_->read(16).empty());
}

TEST_F(SerialSessionTest, ReadOtherErrorIsReported) {
  openSession();
  device_->push_read_error(sys(EIO));
  EXPECT_TRUE(session_->read(16).empty());
  EXPECT_TRUE(session_->is_open());
  EXPECT_EQ(sessionErrors(ErrorCategory::SYSTEM), 1u);
}

TEST_F(SerialSessionTest, ReadRejectsOversizedRequest) {
  openSession();
  EXPECT_TRUE(session_->read(constants::MAX_READ_SIZE + 1).empty());
  EXPECT_EQ(device_->get(&FakeDevice::read_count), 0);
  EXPECT_EQ(sessionErrors(ErrorCategory::CONFIGURATION), 1u);
}

TEST_F(SerialSessionTest, ReadTextRejectsInvalidUtf8) {
  openSession();
  device_->push_read("caf\xC3\xA9");
  EXPECT_EQ(session_->read_text(16), "caf\xC3\xA9");

  device_->push_read("\xC3\x28");
  EXPECT_EQ(session_->read_text(16), "");
  EXPECT_EQ(sessionErrors(ErrorCategory::PROTOCOL), 1u);

  // Truncated sequence at the end of the chunk
  device_->push_read("ok\xE2\x82");
  EXPECT_EQ(session_->read_text(16), "");
}

TEST_F(SerialSessionTest, ReadlineStripsCarriageReturn) {
  openSession();
  device_->push_read("hello\r\nworld\n");
  EXPECT_EQ(session_->readline(), "hello");
  EXPECT_EQ(session_->readline(), "world");
}

TEST_F(SerialSessionTest, ReadlineReturnsPartialLineOnTimeout) {
  openSession();
  device_->push_read("hel");
  EXPECT_EQ(session_->readline(), "hel");
  EXPECT_TRUE(session_->is_open());
}

TEST_F(SerialSessionTest, ReadlineEndsOnEmptyRead) {
  openSession();
  device_->push_read("ab");
  device_->push_empty_read();
  device_->push_read("cd\n");
  EXPECT_EQ(session_->readline(), "ab");
  EXPECT_EQ(session_->readline(), "cd");
}

TEST_F(SerialSessionTest, ReadlineDisconnectionKeepsCollectedBytes) {
  openSession();
  device_->push_read("par");
  device_->push_read_error(boost::asio::error::broken_pipe);
  EXPECT_EQ(session_->readline(), "par");
  EXPECT_FALSE(session_->is_open());
}

TEST_F(SerialSessionTest, BytesAvailable) {
  openSession();
  device_->available = 5;
  EXPECT_EQ(session_->bytes_available(), 5u);

  device_->available_error = sys(EIO);
  EXPECT_EQ(session_->bytes_available(), 0u);
  EXPECT_TRUE(session_->is_open());

  device_->available_error = sys(ENODEV);
  EXPECT_EQ(session_->bytes_available(), 0u);
  EXPECT_FALSE(session_->is_open());
}

TEST_F(SerialSessionTest, ClearBuffer) {
  EXPECT_FALSE(session_->clear_buffer());
  openSession();
  EXPECT_TRUE(session_->clear_buffer());
  EXPECT_EQ(device_->get(&FakeDevice::clear_count), 1);
}

TEST_F(SerialSessionTest, CloseIsIdempotent) {
  openSession();
  session_->close();
  session_->close();
  EXPECT_FALSE(session_->is_open());
  EXPECT_EQ(device_->get(&FakeDevice::close_count), 1);
}

TEST(SerialSessionMockTest, FailedProbeNeverReachesWrite) {
  diagnostics::Logger::instance().set_console_output(false);

  auto holder = std::make_shared<std::unique_ptr<MockSerialPort>>(std::make_unique<NiceMock<MockSerialPort>>());
  MockSerialPort* mock = holder->get();
  SerialSession session([holder]() -> std::unique_ptr<interface::SerialPortInterface> { return std::move(*holder); });

  ASSERT_TRUE(session.set_port(kDevice));
  ASSERT_TRUE(session.open());

  EXPECT_CALL(*mock, bytes_available(_))
      .WillOnce(DoAll(SetArgReferee<0>(boost::system::error_code(boost::asio::error::broken_pipe)), Return(0u)));
  EXPECT_CALL(*mock, write(_, _)).Times(0);
  EXPECT_CALL(*mock, flush(_)).Times(0);
  EXPECT_CALL(*mock, close(_)).Times(1);

  EXPECT_FALSE(session.write_text("never"));
  EXPECT_FALSE(session.is_open());

  diagnostics::Logger::instance().set_console_output(true);
  ErrorHandler::instance().reset_stats();
}
