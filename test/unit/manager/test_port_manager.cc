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

#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/error.hpp>
#include <boost/asio/serial_port_base.hpp>
#include <cerrno>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "mocks/fake_serial_port.hpp"
#include "seriallink/diagnostics/error_handler.hpp"
#include "seriallink/diagnostics/logger.hpp"
#include "seriallink/manager/port_manager.hpp"
#include "utils/test_utils.hpp"

using namespace seriallink;
using namespace seriallink::manager;
using seriallink::diagnostics::ErrorCategory;
using seriallink::diagnostics::ErrorHandler;
using seriallink::test::TestUtils;
using seriallink::test::mocks::FakeDevice;
using seriallink::test::mocks::FakeDeviceBank;
using std::chrono::milliseconds;

namespace {

boost::system::error_code sys(int value) { return boost::system::error_code(value, boost::system::system_category()); }

std::string payload(const PortEvent& event) {
  const auto& data = std::get<DataEvent>(event);
  return std::string(data.bytes.begin(), data.bytes.end());
}

}  // namespace

class PortManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    diagnostics::Logger::instance().set_console_output(false);
    ErrorHandler::instance().reset_stats();
    manager_ = std::make_unique<PortManager>(config::ManagerConfig{}, bank_.factory());
  }

  void TearDown() override {
    manager_.reset();
    ErrorHandler::instance().reset_stats();
    diagnostics::Logger::instance().set_console_output(true);
  }

  // Polls until `count` events were collected or the timeout expires
  std::vector<PortEvent> collect(size_t count, int timeout_ms = 2000) {
    std::vector<PortEvent> all;
    TestUtils::waitForCondition(
        [&]() {
          auto batch = manager_->poll_events();
          all.insert(all.end(), batch.begin(), batch.end());
          return all.size() >= count;
        },
        timeout_ms);
    return all;
  }

  // Polls until a Disconnected event for `id` shows up
  std::vector<PortEvent> collectUntilDisconnected(const std::string& id, int timeout_ms = 2000) {
    std::vector<PortEvent> all;
    TestUtils::waitForCondition(
        [&]() {
          auto batch = manager_->poll_events();
          all.insert(all.end(), batch.begin(), batch.end());
          for (const auto& event : all) {
            if (std::holds_alternative<DisconnectedEvent>(event) && device_id_of(event) == id) return true;
          }
          return false;
        },
        timeout_ms);
    return all;
  }

  FakeDeviceBank bank_;
  std::unique_ptr<PortManager> manager_;
};

TEST_F(PortManagerTest, OpenPortConfiguresDeviceAndStartsReader) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 115200, milliseconds(100), 1));

  EXPECT_TRUE(manager_->is_open("A"));
  EXPECT_EQ(manager_->reader_spawn_count(), 1u);
  EXPECT_EQ(dev->get(&FakeDevice::baud_rate), 115200u);
  EXPECT_EQ(dev->get(&FakeDevice::timeout), milliseconds(100));
  EXPECT_TRUE(TestUtils::waitForCondition([&]() { return dev->get(&FakeDevice::read_count) > 0; }));
}

TEST_F(PortManagerTest, ReopenReplacesReaderAndPort) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(100), 1));
  ASSERT_TRUE(manager_->open_port("A", 19200, milliseconds(100), 1));

  EXPECT_EQ(manager_->reader_spawn_count(), 2u);
  EXPECT_EQ(dev->get(&FakeDevice::close_count), 1);
  EXPECT_EQ(dev->get(&FakeDevice::baud_rate), 19200u);
  EXPECT_EQ(manager_->open_ports(), std::vector<std::string>{"A"});
}

TEST_F(PortManagerTest, InvalidArgumentsOpenNothing) {
  EXPECT_FALSE(manager_->open_port("", 9600, milliseconds(100), 1));
  EXPECT_FALSE(manager_->open_port("A", 0, milliseconds(100), 1));
  EXPECT_FALSE(manager_->open_port("A", 9600, milliseconds(-1), 1));
  EXPECT_FALSE(manager_->open_port("A", 9600, milliseconds(100), 3));

  EXPECT_FALSE(manager_->is_open("A"));
  EXPECT_EQ(manager_->reader_spawn_count(), 0u);
  EXPECT_EQ(bank_.ports_created(), 0);
  EXPECT_EQ(ErrorHandler::instance().get_error_count("manager", ErrorCategory::CONFIGURATION), 4u);
}

TEST_F(PortManagerTest, OpenFailureLeavesNoEntry) {
  bank_.device("A")->open_error = sys(ENOENT);
  EXPECT_FALSE(manager_->open_port("A", 9600, milliseconds(100), 1));
  EXPECT_FALSE(manager_->is_open("A"));
  EXPECT_TRUE(manager_->open_ports().empty());
  EXPECT_EQ(manager_->reader_spawn_count(), 0u);
}

TEST_F(PortManagerTest, EventsKeepPerDeviceOrder) {
  auto a = bank_.device("A");
  auto b = bank_.device("B");
  for (int i = 1; i <= 3; ++i) {
    a->push_read("a" + std::to_string(i) + "\n");
    b->push_read("b" + std::to_string(i) + "\n");
  }
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));
  ASSERT_TRUE(manager_->open_port("B", 9600, milliseconds(10), 1));

  auto events = collect(6);
  ASSERT_EQ(events.size(), 6u);

  std::map<std::string, std::vector<std::string>> by_device;
  for (const auto& event : events) {
    by_device[device_id_of(event)].push_back(payload(event));
  }
  EXPECT_EQ(by_device["A"], (std::vector<std::string>{"a1\n", "a2\n", "a3\n"}));
  EXPECT_EQ(by_device["B"], (std::vector<std::string>{"b1\n", "b2\n", "b3\n"}));

  // Everything was drained
  EXPECT_TRUE(manager_->poll_events().empty());
}

TEST_F(PortManagerTest, LineModeJoinsChunksAcrossReads) {
  auto dev = bank_.device("A");
  dev->push_read("ab");
  dev->push_read("c\n");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = collect(1);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(payload(events[0]), "abc\n");
}

TEST_F(PortManagerTest, LineModeFlushesPartialFrameOnIdle) {
  auto dev = bank_.device("A");
  dev->push_read("no newline");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = collect(1);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(payload(events[0]), "no newline");
}

TEST_F(PortManagerTest, RawModeEmitsEveryRead) {
  auto dev = bank_.device("A");
  dev->push_read("A");
  dev->push_read("B");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 0));

  auto events = collect(2);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(payload(events[0]), "A");
  EXPECT_EQ(payload(events[1]), "B");
}

TEST_F(PortManagerTest, SetDelimiterChangesFraming) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));
  ASSERT_TRUE(manager_->set_delimiter("A", '|'));
  // Let the reader pick up the new mode before data arrives
  TestUtils::waitFor(20);
  dev->push_read("x|y|");

  auto events = collect(2);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(payload(events[0]), "x|");
  EXPECT_EQ(payload(events[1]), "y|");

  EXPECT_FALSE(manager_->set_delimiter("missing", '|'));
}

TEST_F(PortManagerTest, DataCallbackReceivesIdAndBytes) {
  std::vector<std::string> seen;
  manager_->on_data_received([&](const std::string& id, const std::vector<uint8_t>& bytes) {
    seen.push_back(id + ":" + std::string(bytes.begin(), bytes.end()));
  });
  bank_.device("A")->push_read("ping\n");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  collect(1);
  EXPECT_EQ(seen, std::vector<std::string>{"A:ping\n"});
}

TEST_F(PortManagerTest, DisconnectionDropsPartialFrameAndClosesEntry) {
  auto dev = bank_.device("A");
  dev->push_read("tail");
  dev->push_read_error(sys(ENODEV));

  std::vector<std::string> disconnected;
  manager_->on_port_disconnected([&](const std::string& id) { disconnected.push_back(id); });
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = collectUntilDisconnected("A");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<DisconnectedEvent>(events[0]));

  EXPECT_EQ(disconnected, std::vector<std::string>{"A"});
  EXPECT_FALSE(manager_->is_open("A"));
  EXPECT_FALSE(dev->get(&FakeDevice::open));
  EXPECT_EQ(ErrorHandler::instance().get_error_count("reader", ErrorCategory::CONNECTIVITY), 1u);
}

TEST_F(PortManagerTest, HardReadErrorEndsReader) {
  auto dev = bank_.device("A");
  dev->push_read_error(sys(EIO));
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = collectUntilDisconnected("A");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_FALSE(manager_->is_open("A"));
  EXPECT_EQ(ErrorHandler::instance().get_error_count("reader", ErrorCategory::SYSTEM), 1u);
}

TEST_F(PortManagerTest, TransportFaultIsReportedAsConcurrencyFault) {
  bank_.device("A")->throw_on_read = true;
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = collectUntilDisconnected("A");
  ASSERT_FALSE(events.empty());
  EXPECT_TRUE(std::holds_alternative<DisconnectedEvent>(events.back()));
  EXPECT_FALSE(manager_->is_open("A"));
  EXPECT_EQ(ErrorHandler::instance().get_error_count("reader", ErrorCategory::CONCURRENCY), 1u);
}

TEST_F(PortManagerTest, StaleDisconnectDoesNotCloseReopenedPort) {
  auto dev = bank_.device("A");
  dev->push_read_error(sys(ENODEV));
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));
  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return dev->reads_drained(); }));

  // Joining the old reader guarantees its Disconnected event is queued
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = manager_->poll_events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<DisconnectedEvent>(events[0]));
  EXPECT_TRUE(manager_->is_open("A"));
}

TEST_F(PortManagerTest, ThrowingCallbackDoesNotLoseEvents) {
  manager_->on_data_received(
      [](const std::string&, const std::vector<uint8_t>&) { throw std::runtime_error("consumer failure"); });
  auto dev = bank_.device("A");
  dev->push_read("one\n");
  dev->push_read("two\n");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  auto events = collect(2);
  EXPECT_EQ(events.size(), 2u);
  EXPECT_GE(ErrorHandler::instance().get_error_count("manager", ErrorCategory::SYSTEM), 1u);
}

TEST_F(PortManagerTest, ClosePortIsIdempotent) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  manager_->close_port("A");
  manager_->close_port("A");
  manager_->close_port("never-opened");

  EXPECT_FALSE(manager_->is_open("A"));
  EXPECT_EQ(dev->get(&FakeDevice::close_count), 1);

  int reads = dev->get(&FakeDevice::read_count);
  TestUtils::waitFor(20);
  EXPECT_EQ(dev->get(&FakeDevice::read_count), reads);
}

TEST_F(PortManagerTest, CloseAllStopsEveryReader) {
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));
  ASSERT_TRUE(manager_->open_port("B", 9600, milliseconds(10), 0));
  EXPECT_EQ(manager_->open_ports(), (std::vector<std::string>{"A", "B"}));

  manager_->close_all();
  EXPECT_TRUE(manager_->open_ports().empty());
  EXPECT_FALSE(bank_.device("A")->get(&FakeDevice::open));
  EXPECT_FALSE(bank_.device("B")->get(&FakeDevice::open));
}

TEST_F(PortManagerTest, CloseAllFromReaderThreadDefersOwnDevice) {
  auto a = bank_.device("A");
  auto b = bank_.device("B");
  ASSERT_TRUE(manager_->open_port("B", 9600, milliseconds(10), 1));
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  std::atomic<bool> closed{false};
  ErrorHandler::instance().register_callback([&](const diagnostics::ErrorInfo& info) {
    if (info.component == "reader" && info.category == ErrorCategory::CONNECTIVITY) {
      manager_->close_all();
      closed.store(true);
    }
  });
  a->push_read_error(sys(ENODEV));

  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return closed.load(); }));
  ErrorHandler::instance().clear_callbacks();

  EXPECT_TRUE(manager_->open_ports().empty());
  EXPECT_FALSE(b->get(&FakeDevice::open));
  EXPECT_TRUE(TestUtils::waitForCondition([&]() { return !a->get(&FakeDevice::open); }));
  EXPECT_EQ(a->get(&FakeDevice::close_count), 1);

  // The abandoned reader still reports its device; the id is already gone
  auto events = collectUntilDisconnected("A");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_FALSE(manager_->is_open("A"));
}

TEST_F(PortManagerTest, DestructorClosesPorts) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));
  manager_.reset();
  EXPECT_FALSE(dev->get(&FakeDevice::open));
}

TEST_F(PortManagerTest, WritePort) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  EXPECT_TRUE(manager_->write_port("A", TestUtils::bytes("hi")));
  EXPECT_EQ(dev->written_text(), "hi");
  EXPECT_EQ(dev->get(&FakeDevice::flush_count), 1);

  EXPECT_FALSE(manager_->write_port("missing", TestUtils::bytes("hi")));

  {
    std::lock_guard<std::mutex> lock(dev->mutex);
    dev->write_error = boost::asio::error::broken_pipe;
  }
  EXPECT_FALSE(manager_->write_port("A", TestUtils::bytes("again")));
}

TEST_F(PortManagerTest, ReconfigureAppliesValidFieldsAndReportsInvalidOnes) {
  using boost::asio::serial_port_base;
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  // data bits 9 and flow 5 are rejected; the rest still lands on the device
  EXPECT_FALSE(manager_->reconfigure_port("A", 19200, 9, 1, 2, 5, milliseconds(200)));
  EXPECT_EQ(dev->get(&FakeDevice::baud_rate), 19200u);
  EXPECT_EQ(dev->get(&FakeDevice::character_size), 8u);
  EXPECT_EQ(dev->get(&FakeDevice::parity), serial_port_base::parity::odd);
  EXPECT_EQ(dev->get(&FakeDevice::stop_bits), serial_port_base::stop_bits::two);
  EXPECT_EQ(dev->get(&FakeDevice::flow), serial_port_base::flow_control::none);
  EXPECT_EQ(dev->get(&FakeDevice::timeout), milliseconds(200));
  EXPECT_EQ(ErrorHandler::instance().get_error_count("manager", ErrorCategory::CONFIGURATION), 2u);

  EXPECT_TRUE(manager_->reconfigure_port("A", 57600, 7, 2, 1, 2, milliseconds(50)));
  EXPECT_EQ(dev->get(&FakeDevice::character_size), 7u);
  EXPECT_EQ(dev->get(&FakeDevice::flow), serial_port_base::flow_control::hardware);

  EXPECT_FALSE(manager_->reconfigure_port("missing", 9600, 8, 0, 1, 0, milliseconds(10)));
}

TEST_F(PortManagerTest, ReconfigureContinuesPastDeviceFailure) {
  auto dev = bank_.device("A");
  ASSERT_TRUE(manager_->open_port("A", 9600, milliseconds(10), 1));

  {
    std::lock_guard<std::mutex> lock(dev->mutex);
    dev->baud_error = sys(EINVAL);
  }
  EXPECT_FALSE(manager_->reconfigure_port("A", 19200, 7, 0, 1, 0, milliseconds(10)));
  EXPECT_EQ(dev->get(&FakeDevice::baud_rate), 9600u);
  EXPECT_EQ(dev->get(&FakeDevice::character_size), 7u);
}

TEST(PortManagerConfigTest, InvalidConfigIsClamped) {
  diagnostics::Logger::instance().set_console_output(false);
  FakeDeviceBank bank;
  config::ManagerConfig cfg;
  cfg.read_chunk = 0;
  cfg.poll_interval = milliseconds(-3);

  PortManager manager(cfg, bank.factory());
  EXPECT_EQ(manager.config().read_chunk, 1u);
  EXPECT_EQ(manager.config().poll_interval, milliseconds(0));
  diagnostics::Logger::instance().set_console_output(true);
}
