#pragma once
/** @file  Logger.hpp
 *  @brief CSV event logger for export-pipeline milestones.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "io/FileLogger.hpp"

namespace cycleflow {
  namespace core {

    /** One CSV row: which protocol, which pipeline stage, what happened. */
    struct LogEvent {
      std::string sequence; ///< protocol sample name
      std::string stage;    ///< resolve | nesting | tree | unroll | capacity | failure
      std::string detail;
    };

    /**
 * @class Logger
 * @brief Writes `sequence,stage,detail` rows through a buffered FileLogger.
 *
 *  * Synchronous: the pipeline is single-threaded and logs a handful of rows.
 *  * `log()` outside a run is a no-op, so a pipeline can always call it.
 */
    class Logger {

    public:
      Logger() = default;
      virtual ~Logger() = default;

      // --- public API ---
      void startNewRun(const std::string& csvPath); ///< open file + header; throws std::runtime_error
      virtual void log(const LogEvent& event);      ///< append one row
      void finishRun();                             ///< flush + close

      bool running() const { return file_.isOpen(); }

      /// CSV field quoting (RFC 4180): wraps in quotes when needed, doubles inner quotes.
      static std::string csvField(const std::string& raw);

    private:
      io::FileLogger file_;
    };

  } // namespace core
} // namespace cycleflow
