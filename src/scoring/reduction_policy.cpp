#include "scoring/reduction_policy.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <functional>
#include <map>
#include <numeric>
#include "common/exceptions.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

reduction_policy::~reduction_policy() {}

void reduction_policy::validate(const json &parameter) const {
    if (!parameter.is_array() || parameter.size() < 2)
        throw configuration_error("Subtask parameter of " + name() + " should be [weight, target, ...], got " + parameter.dump());
    if (!parameter.at(0).is_number() || parameter.at(0).get<double>() < 0)
        throw configuration_error("Subtask weight should be a non-negative number, got " + parameter.at(0).dump());
}

outcome_label classify_by_range(double outcome) {
    if (outcome <= 0.0)
        return outcome_label::NOT_CORRECT;
    else if (outcome >= 1.0)
        return outcome_label::CORRECT;
    else
        return outcome_label::PARTIALLY_CORRECT;
}

string group_min_policy::name() const {
    return "GroupMin";
}

double group_min_policy::reduce(const vector<double> &outcomes, const json &) const {
    return *min_element(outcomes.begin(), outcomes.end());
}

outcome_label group_min_policy::classify(double outcome, const json &) const {
    return classify_by_range(outcome);
}

string group_mul_policy::name() const {
    return "GroupMul";
}

double group_mul_policy::reduce(const vector<double> &outcomes, const json &) const {
    return accumulate(outcomes.begin(), outcomes.end(), 1.0, multiplies<double>());
}

outcome_label group_mul_policy::classify(double outcome, const json &) const {
    return classify_by_range(outcome);
}

string group_sum_policy::name() const {
    return "GroupSum";
}

double group_sum_policy::reduce(const vector<double> &outcomes, const json &) const {
    return accumulate(outcomes.begin(), outcomes.end(), 0.0) / outcomes.size();
}

outcome_label group_sum_policy::classify(double outcome, const json &) const {
    return classify_by_range(outcome);
}

static map<string, unique_ptr<reduction_policy>> policies;

void register_reduction_policy(unique_ptr<reduction_policy> &&policy) {
    string name = policy->name();
    if (!policies.insert({name, move(policy)}).second)
        DLOG(INFO) << "Reduction policy " << name << " has already been registered";
}

void register_builtin_reduction_policies() {
    register_reduction_policy(make_unique<group_min_policy>());
    register_reduction_policy(make_unique<group_mul_policy>());
    register_reduction_policy(make_unique<group_sum_policy>());
}

const reduction_policy &get_reduction_policy(const string &name) {
    // 注册在启动时完成，之后只读
    auto it = policies.find(name);
    if (it == policies.end())
        throw configuration_error("Unknown score type " + name);
    return *it->second;
}

}  // namespace scoring
