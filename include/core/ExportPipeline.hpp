#pragma once
/** @file  ExportPipeline.hpp
 *  @brief Resolve → nesting check → (tree | trace) sequence shared by all exporters.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// cycleflow headers
#include "core/EngineSettings.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/LoopTree.hpp"
#include "core/LoopUnroller.hpp"
#include "core/ResolvedSequence.hpp"
#include "protocols/CyclingProtocol.hpp"

namespace cycleflow::core {

  /// Whether the target format needs currents in mA (and so a capacity for C-rates).
  enum class CapacityPolicy { Required, NotRequired };

  struct PreparedTree {
    ResolvedSequence steps;
    LoopTree tree;
  };

  struct PreparedTrace {
    ResolvedSequence steps;
    ExecutionTrace trace;
  };

  /**
 * @class ExportPipeline
 * @brief Front door for format exporters.
 *
 *  * Works on clones; the caller's protocol is never modified.
 *  * Every ProtocolError is reported to the ErrorMonitor and logged, then rethrown.
 *  * Index-looping formats use `prepareIndexed()`, nested formats `prepareTree()`,
 *    formats without loops `prepareTrace()`.
 */
  class ExportPipeline {
  public:
    ExportPipeline(std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger = nullptr,
                   EngineSettings settings = {});

    /// Load EngineSettings from \p configPath and start the event log it names, if any.
    static ExportPipeline fromConfig(std::shared_ptr<ErrorMonitor> errorMonitor,
                                     const std::string& configPath);

    //---public APIs------------------------------------------------------
    ResolvedSequence prepareIndexed(const protocols::CyclingProtocol& protocol,
                                    CapacityPolicy capacity = CapacityPolicy::Required) const;
    PreparedTree prepareTree(const protocols::CyclingProtocol& protocol,
                             CapacityPolicy capacity = CapacityPolicy::Required) const;
    PreparedTrace prepareTrace(const protocols::CyclingProtocol& protocol,
                               CapacityPolicy capacity = CapacityPolicy::NotRequired) const;

    const EngineSettings& settings() const { return settings_; }

  private:
    template <typename Fn> auto guarded(const protocols::CyclingProtocol& protocol, Fn&& fn) const;

    ResolvedSequence resolveChecked(const protocols::CyclingProtocol& protocol,
                                    CapacityPolicy capacity) const;
    void record(const protocols::CyclingProtocol& protocol, const std::string& stage,
                const std::string& detail) const;

    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::shared_ptr<Logger> logger_;
    EngineSettings settings_;
  };

} // namespace cycleflow::core
