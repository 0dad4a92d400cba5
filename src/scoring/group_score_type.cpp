#include "scoring/group_score_type.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <regex>
#include <set>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

static optional<string> alt_title_of(const json &parameter) {
    if (parameter.size() >= 3)
        return parameter.back().get<string>();
    return nullopt;
}

static double weight_of(const json &parameter) {
    return parameter.at(0).get<double>();
}

vector<bool> restricted_feedback_flags(const vector<double> &outcomes, const vector<bool> &is_public) {
    if (outcomes.size() != is_public.size())
        throw invalid_argument(fmt::format("{} outcomes given with {} visibility flags", outcomes.size(), is_public.size()));

    vector<bool> flags;
    if (outcomes.empty()) return flags;

    double worst_outcome = *min_element(outcomes.begin(), outcomes.end());
    bool previous_all_correct = true;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        flags.push_back(previous_all_correct);
        if (is_public[i] && outcomes[i] <= worst_outcome)
            previous_all_correct = false;
    }
    return flags;
}

group_score_type::group_score_type(json parameters, map<string, testcase> testcases, const reduction_policy &policy)
    : score_type(move(parameters), move(testcases)), policy(policy) {
    if (!params.is_array() || params.empty())
        throw configuration_error("Parameters of " + policy.name() + " should be a non-empty list of subtasks, got " + params.dump());

    for (auto &parameter : params) {
        policy.validate(parameter);
        const json &target = parameter.at(1);
        bool is_count = target.is_number_integer() && target.get<int64_t>() >= 0;
        if (!is_count && !target.is_string())
            throw configuration_error("Subtask target should be a testcase count or a regular expression, got " + target.dump());
        if (target.is_string() != params.front().at(1).is_string())
            throw configuration_error("Subtask targets should be either all counts or all regular expressions");
        if (parameter.size() >= 3 && !parameter.back().is_string())
            throw configuration_error("Subtask title should be a string, got " + parameter.back().dump());
    }

    targets = retrieve_target_testcases();
}

vector<vector<string>> group_score_type::retrieve_target_testcases() const {
    vector<vector<string>> result;
    // testcases 按识别名排序
    vector<string> codenames;
    for (auto &[codename, tc] : testcases)
        codenames.push_back(codename);

    if (params.front().at(1).is_number()) {
        size_t total = 0;
        for (size_t i = 0; i < params.size(); ++i) {
            size_t count = params.at(i).at(1).get<size_t>();
            if (count > codenames.size() - total)
                throw configuration_error(fmt::format("Subtask {} asks for {} testcases but only {} are left", i + 1, count, codenames.size() - total));
            total += count;
        }
        if (total != codenames.size())
            throw configuration_error(fmt::format("Subtasks cover {} testcases but the dataset has {}", total, codenames.size()));

        auto it = codenames.begin();
        for (auto &parameter : params) {
            auto next = it + parameter.at(1).get<size_t>();
            result.emplace_back(it, next);
            it = next;
        }
    } else {
        set<string> covered;
        for (auto &parameter : params) {
            string pattern = parameter.at(1).get<string>();
            regex matcher;
            try {
                matcher = regex(pattern);
            } catch (regex_error &e) {
                throw configuration_error("Invalid subtask regular expression " + pattern + ": " + e.what());
            }

            vector<string> target;
            for (auto &codename : codenames) {
                // 只要求从识别名开头开始匹配
                if (regex_search(codename, matcher, regex_constants::match_continuous)) {
                    target.push_back(codename);
                    if (!covered.insert(codename).second)
                        LOG(WARNING) << "Testcase " << codename << " belongs to more than one subtask";
                }
            }
            result.push_back(move(target));
        }
        for (auto &codename : codenames)
            if (!covered.count(codename))
                LOG(WARNING) << "Testcase " << codename << " does not belong to any subtask";
    }

    for (size_t i = 0; i < result.size(); ++i)
        if (result[i].empty())
            throw configuration_error(fmt::format("Subtask {} matches no testcase", i + 1));
    return result;
}

bool group_score_type::all_public(const vector<string> &target) const {
    return all_of(target.begin(), target.end(), [this](const string &codename) { return is_public(codename); });
}

const vector<vector<string>> &group_score_type::subtask_targets() const {
    return targets;
}

score_result group_score_type::compute_score(const submission_result &submission) const {
    score_result result;

    // 没有评测结果说明连编译都没有通过
    if (!submission.evaluated()) {
        result.ranking_details.assign(targets.size(), format_score(0.0));
        return result;
    }

    auto evaluations = submission.index_evaluations();

    for (size_t st_idx = 0; st_idx < targets.size(); ++st_idx) {
        const json &parameter = params.at(st_idx);
        const vector<string> &target = targets[st_idx];

        vector<const evaluation *> evs;
        vector<double> outcomes;
        vector<bool> publics;
        for (auto &codename : target) {
            auto it = evaluations.find(codename);
            if (it == evaluations.end())
                throw data_integrity_error(fmt::format("Testcase {} of subtask {} has not been evaluated", codename, st_idx + 1), codename);
            evs.push_back(it->second);
            outcomes.push_back(it->second->outcome);
            publics.push_back(is_public(codename));
        }

        vector<bool> show = restricted_feedback_flags(outcomes, publics);

        vector<testcase_entry> testcases, public_testcases;
        for (size_t i = 0; i < target.size(); ++i) {
            testcase_detail detail;
            detail.idx = target[i];
            detail.outcome = get_message_key(policy.classify(outcomes[i], parameter));
            detail.text = evs[i]->text;
            detail.time = evs[i]->execution_time;
            detail.memory = evs[i]->execution_memory;
            detail.show_in_restricted_feedback = show[i];

            testcases.push_back(detail);
            if (publics[i])
                public_testcases.push_back(detail);
            else
                public_testcases.push_back(testcase_ref{target[i]});
        }

        double st_score_fraction = policy.reduce(outcomes, parameter);
        double st_score = st_score_fraction * weight_of(parameter);
        result.score += st_score;

        subtask_detail subtask;
        subtask.idx = st_idx + 1;
        subtask.score_fraction = st_score_fraction;
        subtask.max_score = weight_of(parameter);
        subtask.testcases = move(testcases);
        subtask.alt_title = alt_title_of(parameter);
        result.subtasks.push_back(subtask);

        if (all_public(target)) {
            result.public_score += st_score;
            result.public_subtasks.push_back(subtask);
        } else {
            subtask_detail public_subtask;
            public_subtask.idx = st_idx + 1;
            public_subtask.testcases = move(public_testcases);
            result.public_subtasks.push_back(public_subtask);
        }

        result.ranking_details.push_back(format_score(round_to(st_score, 2)));
    }

    return result;
}

double group_score_type::max_score() const {
    double score = 0;
    for (auto &parameter : params)
        score += weight_of(parameter);
    return score;
}

double group_score_type::max_public_score() const {
    double score = 0;
    for (size_t i = 0; i < targets.size(); ++i)
        if (all_public(targets[i]))
            score += weight_of(params.at(i));
    return score;
}

vector<string> group_score_type::ranking_headers() const {
    vector<string> headers;
    for (size_t i = 0; i < params.size(); ++i) {
        auto title = alt_title_of(params.at(i));
        if (title)
            headers.push_back(*title);
        else
            headers.push_back(fmt::format("Subtask {} ({})", i + 1, format_score(weight_of(params.at(i)))));
    }
    return headers;
}

}  // namespace scoring
