#pragma once
/** @file  RecordingLogger.hpp
 *  @brief Logger derivative that keeps events in memory for pipeline testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "core/Logger.hpp"

namespace cycleflow {
  namespace test {

    class RecordingLogger : public cycleflow::core::Logger {
    public:
      std::vector<cycleflow::core::LogEvent> events;

      void log(const cycleflow::core::LogEvent& event) override { events.push_back(event); }

      bool sawStage(const std::string& stage) const {
        for (const auto& e : events)
          if (e.stage == stage)
            return true;
        return false;
      }
    };

  } // namespace test
} // namespace cycleflow
