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

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "seriallink/seriallink.hpp"

using namespace seriallink;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop = true; }

}  // namespace

// Watches several devices from one poll loop.
//
//   multi_port_poll /dev/ttyUSB0 /dev/ttyACM0
//   multi_port_poll --config ports.yaml [manager.yaml]
//
// ports.yaml:
//   ports:
//     - id: /dev/ttyUSB0
//       baud: 115200
//     - id: /dev/ttyACM0
//       delimiter: "|"
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: " << argv[0] << " <device>... | --config <ports.yaml> [manager.yaml]" << std::endl;
    return 1;
  }

  std::vector<config::PortSpec> specs;
  ManagerConfig cfg;
  if (std::string(argv[1]) == "--config") {
    if (argc < 3) {
      std::cerr << "--config needs a file" << std::endl;
      return 1;
    }
    try {
      if (argc >= 4) cfg = config::load_manager_config(argv[3]);
      specs = config::load_port_list(argv[2], cfg);
    } catch (const config::ConfigLoadError& e) {
      SERIALLINK_LOG_ERROR("multi_port", "load", e.what());
      return 1;
    }
  } else {
    for (int i = 1; i < argc; ++i) {
      specs.push_back(config::default_port_spec(argv[i], cfg));
    }
  }

  std::signal(SIGINT, handle_signal);

  PortManager manager(cfg);
  manager.on_data_received([](const std::string& id, const std::vector<uint8_t>& bytes) {
    std::cout << id << " <- " << std::string(bytes.begin(), bytes.end()) << std::flush;
  });
  manager.on_port_disconnected([](const std::string& id) { std::cout << id << " disconnected" << std::endl; });

  for (const auto& spec : specs) {
    if (!manager.open_port(spec.id, spec.baud_rate, spec.timeout, spec.mode)) {
      std::cerr << "Skipping " << spec.id << std::endl;
    }
  }

  while (!g_stop && !manager.open_ports().empty()) {
    manager.poll_events();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  manager.close_all();
  return 0;
}
