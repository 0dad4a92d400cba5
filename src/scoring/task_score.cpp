#include "scoring/task_score.hpp"
#include <algorithm>
#include <map>
#include "common/utils.hpp"

namespace scoring {
using namespace std;

static double max_submission_score(const vector<score_result> &results) {
    double score = 0;
    for (auto &result : results)
        score = max(score, result.score);
    return score;
}

static double max_subtask_score(const vector<score_result> &results) {
    map<int, double> best;
    for (auto &result : results) {
        for (auto &subtask : result.subtasks) {
            double st_score = subtask.score_fraction.value_or(0) * subtask.max_score.value_or(0);
            auto it = best.find(subtask.idx);
            if (it == best.end())
                best.emplace(subtask.idx, st_score);
            else
                it->second = max(it->second, st_score);
        }
    }

    double score = 0;
    for (auto &[idx, st_score] : best)
        score += st_score;
    return score;
}

double compute_task_score(const vector<score_result> &results, score_mode mode, int precision) {
    double score = 0;
    switch (mode) {
        case score_mode::MAX:
            score = max_submission_score(results);
            break;
        case score_mode::MAX_SUBTASK:
            score = max_subtask_score(results);
            break;
    }
    return round_to(score, precision);
}

}  // namespace scoring
