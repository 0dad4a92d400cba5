#include <algorithm>
#include <memory>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "scoring/reduction_policy.hpp"

using namespace std;
using namespace nlohmann;
using namespace scoring;

class ReductionPolicyTest : public ::testing::Test {
protected:
    json parameter = json::array({30, 3});
};

TEST_F(ReductionPolicyTest, GroupMinTakesWorstOutcome) {
    const reduction_policy &policy = get_reduction_policy("GroupMin");
    EXPECT_EQ(policy.name(), "GroupMin");
    EXPECT_DOUBLE_EQ(policy.reduce({1.0, 0.6, 1.0}, parameter), 0.6);
    EXPECT_DOUBLE_EQ(policy.reduce({1.0, 1.0}, parameter), 1.0);
    EXPECT_DOUBLE_EQ(policy.reduce({0.0, 1.0}, parameter), 0.0);
}

TEST_F(ReductionPolicyTest, GroupMulTakesProduct) {
    const reduction_policy &policy = get_reduction_policy("GroupMul");
    EXPECT_DOUBLE_EQ(policy.reduce({0.5, 0.5, 1.0}, parameter), 0.25);
    EXPECT_DOUBLE_EQ(policy.reduce({1.0, 1.0}, parameter), 1.0);
}

TEST_F(ReductionPolicyTest, GroupSumTakesMean) {
    const reduction_policy &policy = get_reduction_policy("GroupSum");
    EXPECT_DOUBLE_EQ(policy.reduce({1.0, 0.0, 1.0, 0.0}, parameter), 0.5);
    EXPECT_DOUBLE_EQ(policy.reduce({0.3}, parameter), 0.3);
}

TEST_F(ReductionPolicyTest, ClassifyByRange) {
    for (auto name : {"GroupMin", "GroupMul", "GroupSum"}) {
        const reduction_policy &policy = get_reduction_policy(name);
        EXPECT_EQ(policy.classify(0.0, parameter), outcome_label::NOT_CORRECT) << name;
        EXPECT_EQ(policy.classify(-0.5, parameter), outcome_label::NOT_CORRECT) << name;
        EXPECT_EQ(policy.classify(0.4, parameter), outcome_label::PARTIALLY_CORRECT) << name;
        EXPECT_EQ(policy.classify(1.0, parameter), outcome_label::CORRECT) << name;
        EXPECT_EQ(policy.classify(1.5, parameter), outcome_label::CORRECT) << name;
    }
}

TEST_F(ReductionPolicyTest, LabelsAreMessageKeys) {
    EXPECT_STREQ(get_message_key(outcome_label::NOT_CORRECT), "Not correct");
    EXPECT_STREQ(get_message_key(outcome_label::PARTIALLY_CORRECT), "Partially correct");
    EXPECT_STREQ(get_message_key(outcome_label::CORRECT), "Correct");
}

TEST_F(ReductionPolicyTest, UnknownPolicy) {
    EXPECT_THROW(get_reduction_policy("GroupMedian"), configuration_error);
}

TEST_F(ReductionPolicyTest, RegisterTwiceKeepsFirst) {
    const reduction_policy *before = &get_reduction_policy("GroupMin");
    register_builtin_reduction_policies();
    EXPECT_EQ(before, &get_reduction_policy("GroupMin"));
}

struct group_max_policy : public reduction_policy {
    string name() const override { return "GroupMaxForTest"; }

    double reduce(const vector<double> &outcomes, const json &) const override {
        return *max_element(outcomes.begin(), outcomes.end());
    }

    outcome_label classify(double outcome, const json &) const override {
        return classify_by_range(outcome);
    }
};

TEST_F(ReductionPolicyTest, CustomPolicy) {
    register_reduction_policy(make_unique<group_max_policy>());
    const reduction_policy &policy = get_reduction_policy("GroupMaxForTest");
    EXPECT_DOUBLE_EQ(policy.reduce({0.0, 0.7, 0.2}, parameter), 0.7);
}

TEST_F(ReductionPolicyTest, ValidateParameterShape) {
    const reduction_policy &policy = get_reduction_policy("GroupMin");
    EXPECT_NO_THROW(policy.validate(json::array({30, 3})));
    EXPECT_NO_THROW(policy.validate(json::array({12.5, "sub1.*", "Small"})));
    EXPECT_THROW(policy.validate(json::array({30})), configuration_error);
    EXPECT_THROW(policy.validate(json(30)), configuration_error);
    EXPECT_THROW(policy.validate(json::array({"30", 3})), configuration_error);
    EXPECT_THROW(policy.validate(json::array({-1, 3})), configuration_error);
}
