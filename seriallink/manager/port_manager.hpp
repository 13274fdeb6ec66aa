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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "seriallink/base/visibility.hpp"
#include "seriallink/config/manager_config.hpp"
#include "seriallink/discovery/port_info.hpp"
#include "seriallink/framer/buffering_mode.hpp"
#include "seriallink/interface/iserial_port.hpp"
#include "seriallink/manager/event_queue.hpp"
#include "seriallink/manager/port_event.hpp"
#include "seriallink/manager/reader_task.hpp"
#include "seriallink/manager/shared_port.hpp"
#include "seriallink/transport/serial/boost_serial_port.hpp"

namespace seriallink {
namespace manager {

/**
 * @brief Registry of open devices, each with its own background reader.
 *
 * Readers push DataEvent / DisconnectedEvent into one queue; the host drains
 * it with poll_events(), which is also where the registered callbacks run.
 * A Disconnected event closes the device's registry entry during that poll.
 *
 * Every method may be called from any thread. Only one open device exists
 * per id: opening an id that is already open closes it first.
 */
class SERIALLINK_API PortManager {
 public:
  using DataCallback = std::function<void(const std::string& device_id, const std::vector<uint8_t>& bytes)>;
  using DisconnectCallback = std::function<void(const std::string& device_id)>;

  explicit PortManager(config::ManagerConfig cfg = {},
                       interface::SerialPortFactory factory = transport::default_port_factory());
  ~PortManager();

  PortManager(const PortManager&) = delete;
  PortManager& operator=(const PortManager&) = delete;

  static std::vector<discovery::PortInfo> list_ports();

  /**
   * @brief Open and configure a device and start its reader.
   * @param mode 0=Raw, 1=LineDelimited, 2=CustomDelimiter(LF)
   * @return false on invalid arguments or when the device cannot be opened;
   *         the registry is left without an entry for device_id
   */
  bool open_port(const std::string& device_id, unsigned baud_rate, std::chrono::milliseconds timeout, int mode);
  bool open_port(const std::string& device_id, unsigned baud_rate, std::chrono::milliseconds timeout,
                 const framer::BufferingMode& mode);

  /**
   * @brief Stop the reader, wait for it and drop the entry. No-op for unknown ids.
   */
  void close_port(const std::string& device_id);

  /**
   * @brief Close every device. Safe from a reader thread: that reader's own
   *        device is removed at once and its port closed when the reader exits.
   */
  void close_all();

  bool is_open(const std::string& device_id) const;
  std::vector<std::string> open_ports() const;

  bool write_port(const std::string& device_id, const std::vector<uint8_t>& data);

  /**
   * @brief Apply every field to the live device.
   *
   * Each field is applied on its own; a failure is logged and the remaining
   * fields are still applied.
   *
   * @param parity 0=None, 1=Odd, 2=Even
   * @param flow_control 0=None, 1=Software, 2=Hardware
   * @return true only if every field was applied
   */
  bool reconfigure_port(const std::string& device_id, unsigned baud_rate, unsigned data_bits, int parity,
                        unsigned stop_bits, int flow_control, std::chrono::milliseconds timeout);

  bool set_delimiter(const std::string& device_id, uint8_t delimiter);
  bool set_buffering_mode(const std::string& device_id, const framer::BufferingMode& mode);

  /**
   * @brief Drain every pending event in arrival order. Never blocks on I/O.
   */
  std::vector<PortEvent> poll_events();

  void on_data_received(DataCallback callback);
  void on_port_disconnected(DisconnectCallback callback);

  // Number of reader threads started since construction
  size_t reader_spawn_count() const { return spawn_count_.load(); }

  const config::ManagerConfig& config() const { return cfg_; }

 private:
  struct Entry {
    std::shared_ptr<SharedPort> port;
    std::shared_ptr<ModeCell> mode;
    std::unique_ptr<ReaderTask> task;
  };

  std::shared_ptr<SharedPort> find_port(const std::string& device_id) const;
  void retire(Entry entry);
  void close_if_reader_stopped(const std::string& device_id);
  void dispatch(const PortEvent& event);

  config::ManagerConfig cfg_;
  interface::SerialPortFactory factory_;
  std::shared_ptr<EventQueue> queue_;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, Entry> registry_;

  std::mutex callback_mutex_;
  DataCallback on_data_;
  DisconnectCallback on_disconnect_;

  std::atomic<size_t> spawn_count_{0};
};

}  // namespace manager
}  // namespace seriallink
