#include "scoring/score_type.hpp"
#include <glog/logging.h>
#include "common/stl_utils.hpp"
#include "scoring/group_score_type.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const testcase_detail &detail) {
    j = {{"idx", detail.idx},
         {"outcome", detail.outcome},
         {"text", detail.text},
         {"time", detail.time ? json(*detail.time) : json()},
         {"memory", detail.memory ? json(*detail.memory) : json()},
         {"show_in_restricted_feedback", detail.show_in_restricted_feedback}};
}

void to_json(json &j, const testcase_ref &ref) {
    j = {{"idx", ref.idx}};
}

void to_json(json &j, const testcase_entry &entry) {
    visit(overloaded{
              [&j](const testcase_detail &detail) { to_json(j, detail); },
              [&j](const testcase_ref &ref) { to_json(j, ref); }},
          entry);
}

void to_json(json &j, const subtask_detail &detail) {
    j = {{"idx", detail.idx}};
    if (detail.score_fraction) j["score_fraction"] = *detail.score_fraction;
    if (detail.max_score) j["max_score"] = *detail.max_score;
    json testcases = json::array();
    for (auto &entry : detail.testcases) {
        json item;
        to_json(item, entry);
        testcases.push_back(item);
    }
    j["testcases"] = testcases;
    if (detail.alt_title) j["alt_title"] = *detail.alt_title;
}

void to_json(json &j, const score_result &result) {
    j = {{"score", result.score},
         {"subtasks", result.subtasks},
         {"public_score", result.public_score},
         {"public_subtasks", result.public_subtasks},
         {"ranking_details", result.ranking_details}};
}

score_type::score_type(json parameters, map<string, testcase> testcases)
    : params(move(parameters)), testcases(move(testcases)) {}

score_type::~score_type() {}

const json &score_type::parameters() const {
    return params;
}

bool score_type::is_public(const string &codename) const {
    auto it = testcases.find(codename);
    return it != testcases.end() && it->second.is_public;
}

unique_ptr<score_type> create_score_type(const dataset &data) {
    const reduction_policy &policy = get_reduction_policy(data.score_type);
    LOG(INFO) << "Creating score type " << policy.name() << " for dataset \"" << data.description << "\" with "
              << data.testcases.size() << " testcases";
    return make_unique<group_score_type>(data.score_type_parameters, data.testcases, policy);
}

}  // namespace scoring
