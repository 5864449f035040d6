#include "core/CapacityCheck.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExportPipeline.hpp"
#include "protocols/CyclingProtocol.hpp"
#include "protocols/ProtocolErrors.hpp"

#include "FakeTraceExporter.hpp"
#include "RecordingLogger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace cycleflow::core;
using namespace cycleflow::protocols;
using namespace cycleflow::test;

namespace cycleflow::test {

  class MockErrorMonitor : public ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
  };

  namespace {
    Rest ocv() { return Rest{ std::nullopt, 1.0 }; }

    ConstantCurrent chargeAtRate(double rate) {
      ConstantCurrent cc;
      cc.rate_C = rate;
      cc.untilVoltage_V = 4.2;
      return cc;
    }

    CyclingProtocol crossing() {
      return CyclingProtocol({ ocv(), ocv(), ocv(), ocv(), Loop(1, 2), ocv(), Loop(3, 2) },
                             SampleParams{ "crossing", 1.0 });
    }
  } // namespace

  class ExportPipelineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      logger = std::make_shared<RecordingLogger>();
      pipeline = std::make_unique<ExportPipeline>(std::static_pointer_cast<ErrorMonitor>(errorMonitor),
                                                  std::static_pointer_cast<Logger>(logger));
    }

    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<RecordingLogger> logger;
    std::unique_ptr<ExportPipeline> pipeline;
  };

  TEST_F(ExportPipelineTest, prepareIndexed_ResolvesAndLogsEachStage) {
    CyclingProtocol protocol({ Tag("a"), ocv(), ocv(), Loop("a", 3) }, SampleParams{ "cell", 1.0 });

    ResolvedSequence seq = pipeline->prepareIndexed(protocol);

    EXPECT_EQ(std::get<Loop>(seq[2]).position(), 1u);
    EXPECT_TRUE(logger->sawStage("capacity"));
    EXPECT_TRUE(logger->sawStage("resolve"));
    EXPECT_TRUE(logger->sawStage("nesting"));
    EXPECT_EQ(logger->events.front().sequence, "cell");
  }

  TEST_F(ExportPipelineTest, prepareTree_ReturnsTreeOverResolvedSteps) {
    CyclingProtocol protocol({ Tag("A"), Tag("B"), ocv(), Loop("B", 12), Loop("A", 34) });

    PreparedTree prepared = pipeline->prepareTree(protocol);

    ASSERT_EQ(prepared.tree.size(), 1u);
    EXPECT_EQ(prepared.tree[0].repeatCount(), 34);
    EXPECT_EQ(prepared.steps.size(), 3u);
    EXPECT_TRUE(logger->sawStage("tree"));
  }

  TEST_F(ExportPipelineTest, prepareTrace_UsesConfiguredCeiling) {
    CyclingProtocol protocol({ Tag("A"), Tag("B"), ocv(), Loop("B", 12), Loop("A", 34) });

    EXPECT_EQ(pipeline->prepareTrace(protocol).trace.size(), 408u);

    EngineSettings tight;
    tight.maxUnrollIterations = 50;
    ExportPipeline strict(std::static_pointer_cast<ErrorMonitor>(errorMonitor), nullptr, tight);
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("likely a loop definition error")));
    EXPECT_THROW(strict.prepareTrace(protocol), RunawayExpansionError);
  }

  TEST_F(ExportPipelineTest, intersectingLoops_AreReportedToMonitorAndRethrown) {
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("intersecting loops"))).Times(1);

    EXPECT_THROW(pipeline->prepareTree(crossing()), IntersectingLoopsError);
    EXPECT_TRUE(logger->sawStage("failure"));
    EXPECT_FALSE(logger->sawStage("tree"));
  }

  TEST_F(ExportPipelineTest, missingCapacity_OnlyWhenPolicyRequiresIt) {
    CyclingProtocol protocol({ chargeAtRate(0.5), ocv() });

    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("Sample capacity must be set")))
        .Times(1);
    EXPECT_THROW(pipeline->prepareIndexed(protocol, CapacityPolicy::Required), MissingCapacityError);
    EXPECT_NO_THROW(pipeline->prepareIndexed(protocol, CapacityPolicy::NotRequired));
    EXPECT_NO_THROW(pipeline->prepareIndexed(protocol.withSample(std::nullopt, 2.0)));
  }

  TEST_F(ExportPipelineTest, callerProtocolIsNeverModified) {
    CyclingProtocol protocol({ ocv(), Tag("a"), ocv(), ocv(), Loop("a", 3), Loop(1, 2) },
                             SampleParams{ "cell", 1.0 });
    const CyclingProtocol before = protocol;

    (void)pipeline->prepareIndexed(protocol);
    (void)pipeline->prepareTree(protocol);
    (void)pipeline->prepareTrace(protocol);

    EXPECT_EQ(protocol, before);
  }

  TEST_F(ExportPipelineTest, fakeExporter_RendersTraceAndRejectsUnsupportedSteps) {
    FakeTraceExporter exporter(*pipeline);

    auto lines = exporter.render(CyclingProtocol({ Tag("a"), ocv(), chargeAtRate(0.5), Loop("a", 2) }));
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].rfind("Rest for", 0), 0u);
    EXPECT_EQ(lines[3].rfind("Charge at", 0), 0u);

    ImpedanceSweep eis;
    eis.amplitude_V = 0.01;
    eis.startFrequency_Hz = 1e5;
    eis.endFrequency_Hz = 0.1;
    try {
      exporter.render(CyclingProtocol({ ocv(), eis }));
      FAIL() << "impedance sweep rendered";
    } catch (const UnsupportedStepError& e) {
      EXPECT_EQ(e.stepKind(), "impedance_spectroscopy");
    }
  }

  TEST(CapacityCheckTest, ZeroCapacityCountsAsMissing) {
    std::vector<Step> method{ ocv(), chargeAtRate(1.0) };

    EXPECT_THROW(requireCapacityIfRateUsed(method, 0.0), MissingCapacityError);
    EXPECT_THROW(requireCapacityIfRateUsed(method, std::nullopt), MissingCapacityError);
    EXPECT_NO_THROW(requireCapacityIfRateUsed(method, 1.5));
    EXPECT_NO_THROW(requireCapacityIfRateUsed(std::vector<Step>{ ocv() }, std::nullopt));
  }

  TEST(ErrorMonitorTest, EscalatesEachDistinctFailureOnce) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    monitor.notifyFailure("loop A");
    monitor.notifyFailure("loop A");
    monitor.notifyFailure("loop B");

    EXPECT_EQ(escalated, (std::vector<std::string>{ "loop A", "loop B" }));
    EXPECT_EQ(monitor.failureCount(), 2u);
  }

  TEST(ErrorMonitorTest, WorksWithoutEscalationCallback) {
    ErrorMonitor monitor;
    EXPECT_NO_THROW(monitor.notifyFailure("nobody listening"));
    EXPECT_EQ(monitor.failureCount(), 1u);
  }

} // namespace cycleflow::test
