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
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "seriallink/seriallink.hpp"

using namespace seriallink;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop = true; }

void print_ports() {
  auto ports = SerialSession::list_ports();
  if (ports.empty()) {
    std::cout << "No serial ports found" << std::endl;
    return;
  }
  std::cout << "Available ports:" << std::endl;
  for (const auto& p : ports) {
    std::cout << "  " << p.id << "  [" << p.kind_label << "]  " << p.device_name << std::endl;
  }
}

void print_line(const std::string& line) {
  bool printable = true;
  for (unsigned char c : line) {
    if (!std::isprint(c) && c != '\t') {
      printable = false;
      break;
    }
  }
  if (printable) {
    std::cout << "RX: " << line << std::endl;
    return;
  }

  std::cout << "RX (hex):";
  for (unsigned char c : line) {
    char buf[4];
    std::snprintf(buf, sizeof(buf), " %02X", c);
    std::cout << buf;
  }
  std::cout << std::endl;
}

}  // namespace

/**
 * Single-device monitor.
 *
 * With no arguments, lists the serial ports found on the system. Otherwise
 * opens the device, drops whatever was buffered before we attached, and
 * prints each complete line until Ctrl+C or the device goes away.
 */
int main(int argc, char** argv) {
  if (argc < 2) {
    print_ports();
    std::cout << "Usage: " << argv[0] << " <device> [baud_rate]" << std::endl;
    std::cout << "Example: " << argv[0] << " /dev/ttyUSB0 115200" << std::endl;
    return 0;
  }

  std::signal(SIGINT, handle_signal);

  SerialSession session;
  unsigned baud = constants::DEFAULT_BAUD_RATE;
  if (argc >= 3) {
    baud = static_cast<unsigned>(std::stoul(argv[2]));
  }
  if (!session.set_port(argv[1]) || !session.set_baud_rate(baud) ||
      !session.set_timeout(std::chrono::milliseconds(100))) {
    return 1;
  }

  if (!session.open()) {
    std::cerr << "Cannot open " << argv[1] << std::endl;
    return 1;
  }
  if (!session.clear_buffer()) {
    SERIALLINK_LOG_WARNING("monitor", "run", "Could not drop stale input");
  }
  SERIALLINK_LOG_INFO("monitor", "run", "Monitoring " + config::describe(session.config()));

  size_t total = 0;
  std::string pending;
  while (!g_stop) {
    auto chunk = session.read(256);
    if (chunk.empty()) {
      if (!session.is_open()) {
        SERIALLINK_LOG_WARNING("monitor", "run", "Device disconnected");
        break;
      }
      continue;
    }
    total += chunk.size();
    pending.append(chunk.begin(), chunk.end());

    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, pos);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      print_line(line);
      pending.erase(0, pos + 1);
    }
  }

  if (!pending.empty()) {
    print_line(pending);
  }
  session.close();
  std::cout << "Received " << total << " bytes" << std::endl;
  return 0;
}
