#include <gtest/gtest.h>
#include "exceptions.hpp"
#include "flag_model.hpp"
#include "test_helpers.hpp"
#include <optional>

namespace flagstore {

using testing::ScopedLogCapture;
using testing::flagJson;
using json = nlohmann::json;

class FeatureFlagTest : public ::testing::Test {
protected:
    static json fullFlag() {
        auto data = flagJson("flag-a", 3);
        data["variations"] = {"red", "green", "blue"};
        data["offVariation"] = 2;
        data["fallthrough"] = {{"rollout",
                                {{"kind", "experiment"},
                                 {"variations", {{{"variation", 0}, {"weight", 60000}},
                                                 {{"variation", 1}, {"weight", 40000}}}}}}};
        data["prerequisites"] = json::array({json{{"key", "flag-b"}, {"variation", 0}}});
        data["targets"] = json::array({json{{"values", {"alice", "bob"}}, {"variation", 1}}});
        data["contextTargets"] = json::array(
            {json{{"contextKind", "org"}, {"values", json::array({"acme"})}, {"variation", 0}}});
        json clause = {{"attribute", "email"}, {"op", "endsWith"}, {"values", json::array({"@x.com"})}};
        data["rules"] = json::array(
            {json{{"id", "rule-1"}, {"clauses", json::array({clause})}, {"variation", 1}}});
        return data;
    }
};

TEST_F(FeatureFlagTest, ParsesFields) {
    FeatureFlag flag(fullFlag());

    EXPECT_EQ(flag.getKey(), "flag-a");
    EXPECT_EQ(flag.getVersion(), 3);
    EXPECT_FALSE(flag.isDeleted());
    EXPECT_TRUE(flag.isOn());
    EXPECT_EQ(flag.getVariations().size(), 3u);
    EXPECT_EQ(flag.getOffVariation(), 2);
    ASSERT_TRUE(flag.getFallthrough().rollout.has_value());
    EXPECT_TRUE(flag.getFallthrough().rollout->isExperiment());
    EXPECT_EQ(flag.getFallthrough().rollout->variations.size(), 2u);
    ASSERT_EQ(flag.getPrerequisites().size(), 1u);
    EXPECT_EQ(flag.getPrerequisites()[0].key, "flag-b");
    ASSERT_EQ(flag.getTargets().size(), 1u);
    EXPECT_EQ(flag.getTargets()[0].contextKind, "user");
    EXPECT_EQ(flag.getTargets()[0].values.count("bob"), 1u);
    ASSERT_EQ(flag.getContextTargets().size(), 1u);
    EXPECT_EQ(flag.getContextTargets()[0].contextKind, "org");
    ASSERT_EQ(flag.getRules().size(), 1u);
    EXPECT_EQ(flag.getRules()[0].id, "rule-1");
    EXPECT_EQ(flag.getRules()[0].clauses.size(), 1u);
    EXPECT_EQ(flag.getSalt(), "salt");
}

TEST_F(FeatureFlagTest, PrecomputesResults) {
    FeatureFlag flag(fullFlag());
    const auto& results = flag.getResults();

    EXPECT_EQ(results.offResult.value, "blue");
    EXPECT_EQ(results.offResult.variationIndex, 2);
    EXPECT_EQ(results.offResult.reason.getKind(), EvaluationReason::Kind::OFF);

    ASSERT_EQ(results.fallthroughResults.size(), 3u);
    auto regular = results.fallthroughResults.forVariation(1, false);
    EXPECT_EQ(regular.value, "green");
    EXPECT_FALSE(regular.reason.isInExperiment());
    auto experiment = results.fallthroughResults.forVariation(1, true);
    EXPECT_TRUE(experiment.reason.isInExperiment());
    EXPECT_EQ(experiment.reason.getKind(), EvaluationReason::Kind::FALLTHROUGH);

    ASSERT_EQ(results.ruleMatchResults.size(), 1u);
    auto ruleMatch = results.ruleMatchResults[0].forVariation(1, false);
    EXPECT_EQ(ruleMatch.reason.getKind(), EvaluationReason::Kind::RULE_MATCH);
    EXPECT_EQ(ruleMatch.reason.getRuleIndex(), 0);
    EXPECT_EQ(ruleMatch.reason.getRuleId(), "rule-1");

    ASSERT_EQ(results.prerequisiteFailureResults.size(), 1u);
    const auto& prereqFailed = results.prerequisiteFailureResults[0];
    EXPECT_EQ(prereqFailed.value, "blue");
    EXPECT_EQ(prereqFailed.reason.getKind(), EvaluationReason::Kind::PREREQUISITE_FAILED);
    EXPECT_EQ(prereqFailed.reason.getPrerequisiteKey(), "flag-b");

    ASSERT_EQ(results.targetMatchResults.size(), 1u);
    EXPECT_EQ(results.targetMatchResults[0].value, "green");
    EXPECT_EQ(results.targetMatchResults[0].reason.getKind(), EvaluationReason::Kind::TARGET_MATCH);
    ASSERT_EQ(results.contextTargetMatchResults.size(), 1u);
    EXPECT_EQ(results.contextTargetMatchResults[0].value, "red");
}

TEST_F(FeatureFlagTest, OutOfRangeIndexIsMalformed) {
    FeatureFlag flag(fullFlag());
    auto detail = flag.getResults().fallthroughResults.forVariation(7, false);

    EXPECT_TRUE(detail.value.is_null());
    EXPECT_FALSE(detail.variationIndex.has_value());
    EXPECT_EQ(detail.reason.getKind(), EvaluationReason::Kind::ERROR);
    EXPECT_EQ(detail.reason.getErrorKind(), EvaluationReason::ErrorKind::MALFORMED_FLAG);
}

TEST_F(FeatureFlagTest, MissingOffVariationGivesNullOffResult) {
    auto data = flagJson("flag-a", 1);
    data.erase("offVariation");
    FeatureFlag flag(data);

    EXPECT_TRUE(flag.getResults().offResult.value.is_null());
    EXPECT_FALSE(flag.getResults().offResult.variationIndex.has_value());
    EXPECT_EQ(flag.getResults().offResult.reason.getKind(), EvaluationReason::Kind::OFF);
}

TEST_F(FeatureFlagTest, LogsEachInconsistencyOnce) {
    ScopedLogCapture capture;
    auto data = flagJson("broken", 1);
    data["fallthrough"] = {{"variation", 5}};
    data["targets"] = json::array({json{{"values", json::array({"alice"})}, {"variation", -1}}});

    FeatureFlag flag(data);

    EXPECT_EQ(capture.handler().countContaining(
                  LogLevel::WARN, "Data inconsistency in feature flag \"broken\": fallthrough has invalid variation index"),
              1u);
    EXPECT_EQ(capture.handler().countContaining(
                  LogLevel::WARN, "Data inconsistency in feature flag \"broken\": target has invalid variation index"),
              1u);
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "Data inconsistency"), 2u);

    EXPECT_EQ(flag.getResults().targetMatchResults[0].reason.getErrorKind(),
              EvaluationReason::ErrorKind::MALFORMED_FLAG);
}

TEST_F(FeatureFlagTest, OutOfRangeOffVariationIsLoggedNotThrown) {
    ScopedLogCapture capture;
    auto data = flagJson("flag-off", 1);
    data["variations"] = {"a", "b"};
    data["offVariation"] = 2;

    std::optional<FeatureFlag> flag;
    ASSERT_NO_THROW(flag.emplace(data));

    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "Data inconsistency"), 1u);
    EXPECT_EQ(capture.handler().countContaining(
                  LogLevel::WARN, "Data inconsistency in feature flag \"flag-off\": off variation has invalid variation index"),
              1u);
    const auto& offResult = flag->getResults().offResult;
    EXPECT_TRUE(offResult.value.is_null());
    EXPECT_EQ(offResult.reason.getErrorKind(), EvaluationReason::ErrorKind::MALFORMED_FLAG);
}

TEST_F(FeatureFlagTest, IndexBeyondIntRangeIsNotTruncated) {
    ScopedLogCapture capture;
    auto data = flagJson("flag-wide", 1);
    data["variations"] = {"a", "b"};
    data["offVariation"] = int64_t{4294967296};
    data["fallthrough"] = {{"variation", int64_t{4294967297}}};

    FeatureFlag flag(data);

    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "off variation has invalid variation index"), 1u);
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "fallthrough has invalid variation index"), 1u);
    const auto& offResult = flag.getResults().offResult;
    EXPECT_TRUE(offResult.value.is_null());
    EXPECT_FALSE(offResult.variationIndex.has_value());
    EXPECT_EQ(offResult.reason.getErrorKind(), EvaluationReason::ErrorKind::MALFORMED_FLAG);
    EXPECT_EQ(flag.toJson()["offVariation"], int64_t{4294967296});
}

TEST_F(FeatureFlagTest, ConsistentFlagLogsNothing) {
    ScopedLogCapture capture;
    FeatureFlag flag(fullFlag());
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "Data inconsistency"), 0u);
}

TEST_F(FeatureFlagTest, TombstoneSkipsParsing) {
    ScopedLogCapture capture;
    nlohmann::json data = {{"key", "gone"}, {"version", 9}, {"deleted", true}, {"fallthrough", {{"variation", 42}}}};
    FeatureFlag flag(data);

    EXPECT_TRUE(flag.isDeleted());
    EXPECT_EQ(flag.getVersion(), 9);
    EXPECT_TRUE(flag.getResults().ruleMatchResults.empty());
    EXPECT_EQ(flag.getResults().fallthroughResults.size(), 0u);
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "Data inconsistency"), 0u);
}

TEST_F(FeatureFlagTest, RejectsNonObjects) {
    EXPECT_THROW(FeatureFlag{nlohmann::json::array()}, ValidationException);
    EXPECT_THROW(FeatureFlag{nlohmann::json("flag")}, ValidationException);
}

TEST_F(FeatureFlagTest, RejectsMistypedFields) {
    auto data = flagJson("flag-a", 1);
    data["version"] = "three";
    EXPECT_THROW(FeatureFlag{data}, ValidationException);
}

TEST_F(FeatureFlagTest, SerializesToInput) {
    auto data = fullFlag();
    FeatureFlag flag(data);
    EXPECT_EQ(flag.toJson(), data);
    EXPECT_EQ(flag, FeatureFlag(data));
    EXPECT_NE(flag, FeatureFlag(flagJson("flag-a", 4)));
}

} // namespace flagstore
