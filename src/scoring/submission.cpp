#include "scoring/submission.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

bool submission_result::compiled() const {
    return compilation_outcome == "ok";
}

bool submission_result::evaluated() const {
    return evaluation_outcome.has_value();
}

map<string, const evaluation *> submission_result::index_evaluations() const {
    map<string, const evaluation *> index;
    for (auto &ev : evaluations) {
        if (!index.emplace(ev.codename, &ev).second)
            throw data_integrity_error("Testcase " + ev.codename + " has more than one evaluation", ev.codename);
    }
    return index;
}

void from_json(const json &j, evaluation &ev) {
    j.at("codename").get_to(ev.codename);
    j.at("outcome").get_to(ev.outcome);
    ev.text = get_value_def<json>(j, json::array(), "text");
    ev.execution_time = get_optional<double>(j, "execution_time");
    ev.execution_memory = get_optional<int64_t>(j, "execution_memory");
}

void from_json(const json &j, submission_result &result) {
    if (exists(j, "compilation_outcome"))
        result.compilation_outcome = j.at("compilation_outcome").get<string>();
    result.compilation_text = get_value_def<json>(j, json::array(), "compilation_text");
    result.evaluation_outcome = get_optional<string>(j, "evaluation_outcome");
    result.evaluations = get_value_def<vector<evaluation>>(j, {}, "evaluations");
}

submission_result load_submission_result(const filesystem::path &path) {
    json content = read_json_file(path);
    try {
        return content.get<submission_result>();
    } catch (json::exception &e) {
        throw configuration_error("Invalid submission result " + path.string() + ": " + e.what());
    } catch (invalid_argument &e) {
        throw configuration_error("Invalid submission result " + path.string() + ": " + e.what());
    }
}

}  // namespace scoring
