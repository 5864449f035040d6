/* @file Logger.cpp
 * @brief CSV formatting on top of io::FileLogger.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// cycleflow headers
#include "core/Logger.hpp"

using namespace cycleflow::core;

void Logger::startNewRun(const std::string& csvPath) {
  if (!file_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open event log: " + csvPath);
  file_.write("sequence,stage,detail\n");
}

void Logger::log(const LogEvent& event) {
  if (!file_.isOpen())
    return;
  file_.write(csvField(event.sequence) + "," + csvField(event.stage) + "," +
              csvField(event.detail) + "\n");
}

void Logger::finishRun() {
  if (!file_.isOpen())
    return;
  if (!file_.flush())
    std::cerr << "[Logger] final flush failed\n";
  file_.close();
}

std::string Logger::csvField(const std::string& raw) {
  if (raw.find_first_of(",\"\r\n") == std::string::npos)
    return raw;
  std::string out = "\"";
  for (char c : raw) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}
