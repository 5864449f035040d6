/* @file ExportPipeline.cpp
 * @brief Runs the resolution stages in order and escalates failures.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <memory>
#include <string>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cycleflow headers
#include "core/CapacityCheck.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ExportPipeline.hpp"
#include "core/NestingChecker.hpp"
#include "core/TagResolver.hpp"
#include "protocols/ProtocolErrors.hpp"

using namespace cycleflow::core;
using cycleflow::protocols::CyclingProtocol;

ExportPipeline::ExportPipeline(std::shared_ptr<ErrorMonitor> errorMonitor,
                               std::shared_ptr<Logger> logger, EngineSettings settings)
    : errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)),
      settings_(std::move(settings)) {
  assert(errorMonitor_ && "[ExportPipeline] error monitor is nullptr");
}

ExportPipeline ExportPipeline::fromConfig(std::shared_ptr<ErrorMonitor> errorMonitor,
                                          const std::string& configPath) {
  EngineSettings settings = EngineSettings::fromJson(ConfigLoader(configPath).load());

  std::shared_ptr<Logger> logger;
  if (settings.eventLogPath) {
    logger = std::make_shared<Logger>();
    logger->startNewRun(*settings.eventLogPath);
  }
  return ExportPipeline(std::move(errorMonitor), std::move(logger), std::move(settings));
}

template <typename Fn>
auto ExportPipeline::guarded(const CyclingProtocol& protocol, Fn&& fn) const {
  try {
    return fn();
  } catch (const protocols::ProtocolError& e) {
    std::string errMsg = "[ExportPipeline] " + protocol.sample().name + ": " + e.what();
    record(protocol, "failure", e.what());
    errorMonitor_->notifyFailure(errMsg);
    throw;
  }
}

ResolvedSequence ExportPipeline::prepareIndexed(const CyclingProtocol& protocol,
                                                CapacityPolicy capacity) const {
  return guarded(protocol, [&] { return resolveChecked(protocol, capacity); });
}

PreparedTree ExportPipeline::prepareTree(const CyclingProtocol& protocol,
                                         CapacityPolicy capacity) const {
  return guarded(protocol, [&] {
    ResolvedSequence steps = resolveChecked(protocol, capacity);
    LoopTree tree = buildLoopTree(steps);
    record(protocol, "tree", std::to_string(tree.size()) + " top-level nodes");
    return PreparedTree{ std::move(steps), std::move(tree) };
  });
}

PreparedTrace ExportPipeline::prepareTrace(const CyclingProtocol& protocol,
                                           CapacityPolicy capacity) const {
  return guarded(protocol, [&] {
    ResolvedSequence steps = resolveChecked(protocol, capacity);
    ExecutionTrace trace = unroll(steps, settings_.maxUnrollIterations);
    record(protocol, "unroll", std::to_string(trace.size()) + " steps");
    return PreparedTrace{ std::move(steps), std::move(trace) };
  });
}

ResolvedSequence ExportPipeline::resolveChecked(const CyclingProtocol& protocol,
                                                CapacityPolicy capacity) const {
  if (capacity == CapacityPolicy::Required) {
    requireCapacityIfRateUsed(protocol);
    record(protocol, "capacity", "ok");
  }

  ResolvedSequence steps = resolveTags(protocol);
  record(protocol, "resolve",
         std::to_string(protocol.method().size()) + " -> " + std::to_string(steps.size()) +
             " steps");

  checkNesting(steps);
  record(protocol, "nesting", std::to_string(loopIntervals(steps).size()) + " loops ok");
  return steps;
}

void ExportPipeline::record(const CyclingProtocol& protocol, const std::string& stage,
                            const std::string& detail) const {
  if (logger_)
    logger_->log(LogEvent{ protocol.sample().name, stage, detail });
}
