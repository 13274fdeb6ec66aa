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

#include "seriallink/manager/reader_task.hpp"

#include <boost/asio/buffer.hpp>
#include <system_error>
#include <utility>
#include <vector>

#include "seriallink/diagnostics/disconnect_classifier.hpp"
#include "seriallink/diagnostics/error_handler.hpp"
#include "seriallink/diagnostics/logger.hpp"
#include "seriallink/framer/buffering_framer.hpp"

namespace seriallink {
namespace manager {

using diagnostics::classify_error;
using diagnostics::ErrorClass;
namespace error_reporting = diagnostics::error_reporting;

namespace {
constexpr const char* COMPONENT = "reader";
}

struct ReaderTask::State {
  std::string device_id;
  std::shared_ptr<SharedPort> port;
  std::shared_ptr<ModeCell> mode;
  std::shared_ptr<EventQueue> queue;
  std::chrono::milliseconds poll_interval;
  size_t read_chunk;
  size_t max_frame_length;

  std::atomic<bool> stop{false};
  std::atomic<bool> running{false};
  std::atomic<bool> close_on_exit{false};
};

ReaderTask::ReaderTask(std::string device_id, std::shared_ptr<SharedPort> port, std::shared_ptr<ModeCell> mode,
                       std::shared_ptr<EventQueue> queue, const config::ManagerConfig& cfg)
    : state_(std::make_shared<State>()) {
  state_->device_id = std::move(device_id);
  state_->port = std::move(port);
  state_->mode = std::move(mode);
  state_->queue = std::move(queue);
  state_->poll_interval = cfg.poll_interval;
  state_->read_chunk = cfg.read_chunk;
  state_->max_frame_length = cfg.max_frame_length;
}

ReaderTask::~ReaderTask() {
  if (!thread_.joinable()) {
    return;
  }
  if (on_task_thread()) {
    // The thread holds its own reference to the state
    request_stop();
    thread_.detach();
  } else {
    stop();
  }
}

void ReaderTask::start() {
  if (thread_.joinable()) {
    return;
  }
  state_->stop.store(false);
  state_->running.store(true);
  auto state = state_;
  thread_ = std::thread([state] { run(state); });
}

void ReaderTask::request_stop() { state_->stop.store(true); }

void ReaderTask::stop() {
  request_stop();
  if (!thread_.joinable()) {
    return;
  }
  if (on_task_thread()) {
    SERIALLINK_LOG_ERROR(COMPONENT, "stop", "Reader for " + state_->device_id + " cannot join itself");
    return;
  }
  thread_.join();
}

void ReaderTask::abandon() {
  state_->close_on_exit.store(true);
  request_stop();
}

bool ReaderTask::running() const { return state_->running.load(); }

const std::string& ReaderTask::device_id() const { return state_->device_id; }

void ReaderTask::run(const std::shared_ptr<State>& state) {
  State& st = *state;
  SERIALLINK_LOG_DEBUG(COMPONENT, "run", "Reader started for " + st.device_id);

  framer::BufferingFramer framer(st.mode->get(), st.max_frame_length);
  framer.set_on_message([&st](std::vector<uint8_t> message) {
    st.queue->push(DataEvent{st.device_id, std::move(message)});
  });

  std::vector<uint8_t> buffer(st.read_chunk);

  while (!st.stop.load()) {
    boost::system::error_code ec;
    size_t n = 0;
    try {
      std::lock_guard<std::mutex> lock(st.port->mutex);
      n = st.port->port->read_some(boost::asio::buffer(buffer), ec);
    } catch (const std::system_error& e) {
      framer.reset();
      error_reporting::report_concurrency_fault(COMPONENT, "read",
                                                "Port lock failed for " + st.device_id + ": " + e.what());
      signal_disconnected(st);
      break;
    } catch (const std::exception& e) {
      framer.reset();
      error_reporting::report_concurrency_fault(COMPONENT, "read",
                                                "Transport fault on " + st.device_id + ": " + e.what());
      signal_disconnected(st);
      break;
    }

    auto mode = st.mode->get();
    if (!(mode == framer.mode())) {
      framer.set_mode(mode);
    }

    if (ec) {
      ErrorClass cls = classify_error(ec);
      if (cls != ErrorClass::Transient) {
        // A hard error ends the stream; a partial frame is never delivered
        framer.reset();
        if (cls == ErrorClass::Disconnection) {
          SERIALLINK_LOG_WARNING(COMPONENT, "read", "Device disconnected: " + st.device_id + " - " + ec.message());
          error_reporting::report_connectivity_error(COMPONENT, "read", ec);
        } else {
          SERIALLINK_LOG_ERROR(COMPONENT, "read", "Read failed on " + st.device_id + ": " + ec.message());
          error_reporting::report_system_error(COMPONENT, "read", "Read failed on " + st.device_id, ec);
        }
        signal_disconnected(st);
        break;
      }
      framer.on_timeout();
    } else if (n == 0) {
      framer.on_timeout();
    } else {
      SERIALLINK_LOG_DEBUG(COMPONENT, "read", st.device_id + " <- " + diagnostics::hex_preview(buffer.data(), n));
      framer.push_bytes(buffer.data(), n);
    }

    if (st.poll_interval.count() > 0) {
      std::this_thread::sleep_for(st.poll_interval);
    } else {
      std::this_thread::yield();
    }
  }

  st.running.store(false);
  if (st.close_on_exit.load()) {
    boost::system::error_code ec;
    std::lock_guard<std::mutex> lock(st.port->mutex);
    st.port->port->close(ec);
  }
  SERIALLINK_LOG_DEBUG(COMPONENT, "run", "Reader stopped for " + st.device_id);
}

void ReaderTask::signal_disconnected(State& state) {
  // Cleared before the event is visible so the consumer sees a stopped reader
  state.running.store(false);
  state.queue->push(DisconnectedEvent{state.device_id});
}

}  // namespace manager
}  // namespace seriallink
