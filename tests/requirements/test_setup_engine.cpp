#include "requirements/setup_engine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "common/test_support.hpp"
#include "requirements/requirement.hpp"

namespace devpreview::test {

using requirements::FunctionRequirement;
using requirements::Requirement;
using requirements::SetupEngine;
using ::testing::Return;
using namespace std::chrono_literals;

class MockRequirement : public Requirement {
public:
    MOCK_METHOD(std::string, title, (), (const, override));
    MOCK_METHOD(std::optional<std::string>, supplementalMessage, (),
                (const, override));
    MOCK_METHOD(PreviewResult<std::string>, check, (), (override));
};

namespace {

auto passing(const std::string& title) -> std::shared_ptr<Requirement> {
    return std::make_shared<FunctionRequirement>(
        title, [title]() -> PreviewResult<std::string> {
            return title + " is fine.";
        });
}

auto failing(const std::string& title) -> std::shared_ptr<Requirement> {
    return std::make_shared<FunctionRequirement>(
        title, []() -> PreviewResult<std::string> {
            return failure(PreviewErrorCode::ToolchainMissing, "Tool is missing.");
        });
}

}  // namespace

class SetupEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    SetupEngine engine_{clock_, makeNullLogger()};
};

TEST_F(SetupEngineTest, EmptySetupMeetsAllRequirements) {
    auto report = engine_.executeSetup();
    EXPECT_TRUE(report.allRequirementsMet());
    EXPECT_TRUE(report.outcomes().empty());
    EXPECT_EQ(report.summary(), "0 of 0 requirements passed");
}

TEST_F(SetupEngineTest, OneRejectionFailsTheSetup) {
    engine_.addRequirements({passing("First"), failing("Second"), passing("Third")});

    auto report = engine_.executeSetup();
    EXPECT_FALSE(report.allRequirementsMet());
    ASSERT_EQ(report.outcomes().size(), 3u);
    EXPECT_EQ(report.passedCount(), 2u);
    EXPECT_EQ(report.summary(), "2 of 3 requirements passed");

    EXPECT_EQ(report.outcomes()[0].title, "First");
    EXPECT_TRUE(report.outcomes()[0].passed);
    EXPECT_EQ(report.outcomes()[0].message, "First is fine.");

    EXPECT_EQ(report.outcomes()[1].title, "Second");
    EXPECT_FALSE(report.outcomes()[1].passed);
    EXPECT_EQ(report.outcomes()[1].message, "Tool is missing.");

    EXPECT_TRUE(report.outcomes()[2].passed);
}

TEST_F(SetupEngineTest, ThrowingCheckIsRejected) {
    engine_.addRequirement(std::make_shared<FunctionRequirement>(
        "Exploding", []() -> PreviewResult<std::string> {
            throw std::runtime_error("probe crashed");
        }));
    engine_.addRequirement(passing("Survivor"));

    auto report = engine_.executeSetup();
    EXPECT_FALSE(report.allRequirementsMet());
    ASSERT_EQ(report.outcomes().size(), 2u);
    EXPECT_FALSE(report.outcomes()[0].passed);
    EXPECT_EQ(report.outcomes()[0].message, "probe crashed");
    EXPECT_TRUE(report.outcomes()[1].passed);
}

TEST_F(SetupEngineTest, NonStandardExceptionIsRejected) {
    engine_.addRequirement(std::make_shared<FunctionRequirement>(
        "Odd", []() -> PreviewResult<std::string> { throw 42; }));
    auto report = engine_.executeSetup();
    ASSERT_EQ(report.outcomes().size(), 1u);
    EXPECT_FALSE(report.outcomes()[0].passed);
    EXPECT_EQ(report.outcomes()[0].message, "unknown error");
}

TEST_F(SetupEngineTest, NullRequirementIsIgnored) {
    engine_.addRequirement(nullptr);
    engine_.addRequirement(passing("Only"));
    EXPECT_EQ(engine_.requirements().size(), 1u);
}

TEST_F(SetupEngineTest, DurationIsMeasuredWithInjectedClock) {
    engine_.addRequirement(std::make_shared<FunctionRequirement>(
        "Slow", [this]() -> PreviewResult<std::string> {
            clock_->advance(1500ms);
            return std::string("done");
        }));

    auto report = engine_.executeSetup();
    ASSERT_EQ(report.outcomes().size(), 1u);
    EXPECT_DOUBLE_EQ(report.outcomes()[0].durationSeconds, 1.5);
    EXPECT_DOUBLE_EQ(report.totalDurationSeconds(), 1.5);
}

TEST_F(SetupEngineTest, DurationIsRecordedForThrowingCheck) {
    engine_.addRequirement(std::make_shared<FunctionRequirement>(
        "SlowCrash", [this]() -> PreviewResult<std::string> {
            clock_->advance(250ms);
            throw std::runtime_error("late failure");
        }));

    auto report = engine_.executeSetup();
    ASSERT_EQ(report.outcomes().size(), 1u);
    EXPECT_DOUBLE_EQ(report.outcomes()[0].durationSeconds, 0.25);
}

TEST_F(SetupEngineTest, ChecksRunConcurrently) {
    std::atomic<int> arrived{0};
    auto rendezvous = [&arrived]() -> PreviewResult<std::string> {
        ++arrived;
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (arrived.load() < 2) {
            if (std::chrono::steady_clock::now() > deadline) {
                return failure(PreviewErrorCode::Unknown, "ran alone");
            }
            std::this_thread::sleep_for(1ms);
        }
        return std::string("met the other check");
    };
    engine_.addRequirements({std::make_shared<FunctionRequirement>("A", rendezvous),
                             std::make_shared<FunctionRequirement>("B", rendezvous)});

    auto report = engine_.executeSetup();
    EXPECT_TRUE(report.allRequirementsMet());
}

TEST_F(SetupEngineTest, SupplementalMessageIsReported) {
    engine_.addRequirement(std::make_shared<FunctionRequirement>(
        "Hinted",
        []() -> PreviewResult<std::string> {
            return failure(PreviewErrorCode::ToolchainMissing, "Missing.");
        },
        std::string("Install the tool.")));

    auto report = engine_.executeSetup();
    ASSERT_EQ(report.outcomes().size(), 1u);
    EXPECT_EQ(report.outcomes()[0].supplementalMessage, "Install the tool.");

    auto json = report.toJson();
    EXPECT_FALSE(json["hasMetAllRequirements"].get<bool>());
    EXPECT_EQ(json["summary"], "0 of 1 requirements passed");
    ASSERT_EQ(json["tests"].size(), 1u);
    EXPECT_EQ(json["tests"][0]["title"], "Hinted");
    EXPECT_FALSE(json["tests"][0]["hasPassed"].get<bool>());
    EXPECT_EQ(json["tests"][0]["message"], "Missing.");
    EXPECT_EQ(json["tests"][0]["supplementalMessage"], "Install the tool.");
}

TEST_F(SetupEngineTest, OutcomeJsonOmitsMissingSupplementalMessage) {
    engine_.addRequirement(passing("Plain"));
    auto json = engine_.executeSetup().toJson();
    EXPECT_TRUE(json["hasMetAllRequirements"].get<bool>());
    EXPECT_FALSE(json["tests"][0].contains("supplementalMessage"));
    EXPECT_TRUE(json["tests"][0].contains("duration"));
}

TEST_F(SetupEngineTest, MockRequirementIsCheckedOnce) {
    auto mock = std::make_shared<MockRequirement>();
    EXPECT_CALL(*mock, title()).WillRepeatedly(Return("Mocked"));
    EXPECT_CALL(*mock, supplementalMessage())
        .WillRepeatedly(Return(std::optional<std::string>{}));
    EXPECT_CALL(*mock, check())
        .Times(1)
        .WillOnce(Return(PreviewResult<std::string>("mocked ok")));
    engine_.addRequirement(mock);

    auto report = engine_.executeSetup();
    ASSERT_EQ(report.outcomes().size(), 1u);
    EXPECT_TRUE(report.outcomes()[0].passed);
    EXPECT_EQ(report.outcomes()[0].title, "Mocked");
    EXPECT_EQ(report.outcomes()[0].message, "mocked ok");
}

TEST_F(SetupEngineTest, AsyncSetupProducesSameReport) {
    engine_.addRequirements({passing("One"), failing("Two")});
    auto future = engine_.executeSetupAsync();
    auto report = future.get();
    EXPECT_FALSE(report.allRequirementsMet());
    EXPECT_EQ(report.passedCount(), 1u);
}

}  // namespace devpreview::test
