#include "scoring/task.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

static feedback_level parse_feedback_level(const string &value) {
    string level = boost::to_lower_copy(value);
    if (level == "full") return feedback_level::FULL;
    if (level == "restricted") return feedback_level::RESTRICTED;
    throw configuration_error("Unknown feedback level " + value);
}

static score_mode parse_score_mode(const string &value) {
    string mode = boost::to_lower_copy(value);
    if (mode == "max") return score_mode::MAX;
    if (mode == "max_subtask") return score_mode::MAX_SUBTASK;
    throw configuration_error("Unknown score mode " + value);
}

void from_json(const json &j, testcase &tc) {
    j.at("codename").get_to(tc.codename);
    tc.is_public = get_value_def<bool>(j, false, "is_public");
}

void from_json(const json &j, dataset &data) {
    data.description = get_value_def<string>(j, "", "description");
    j.at("score_type").get_to(data.score_type);
    data.score_type_parameters = j.at("score_type_parameters");

    data.testcases.clear();
    for (auto &item : j.at("testcases")) {
        testcase tc = item.get<testcase>();
        if (data.testcases.count(tc.codename))
            throw configuration_error("Duplicate testcase " + tc.codename);
        data.testcases[tc.codename] = tc;
    }
}

void from_json(const json &j, task &t) {
    j.at("name").get_to(t.name);
    t.mode = parse_score_mode(get_value_def<string>(j, "max", "score_mode"));
    t.score_precision = get_value_def<int>(j, 0, "score_precision");
    t.feedback = parse_feedback_level(get_value_def<string>(j, "full", "feedback_level"));
    j.at("active_dataset").get_to(t.active_dataset);
}

task load_task(const filesystem::path &path) {
    json config = read_json_file(path);
    try {
        return config.get<task>();
    } catch (json::exception &e) {
        throw configuration_error("Invalid task configuration " + path.string() + ": " + e.what());
    } catch (invalid_argument &e) {
        throw configuration_error("Invalid task configuration " + path.string() + ": " + e.what());
    }
}

}  // namespace scoring
