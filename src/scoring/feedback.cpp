#include "scoring/feedback.hpp"
#include "common/stl_utils.hpp"
#include "scoring/status_text.hpp"

namespace scoring {
using namespace std;

vector<subtask_detail> apply_feedback_level(const vector<subtask_detail> &public_subtasks, feedback_level level) {
    if (level == feedback_level::FULL) return public_subtasks;

    vector<subtask_detail> result = public_subtasks;
    for (auto &subtask : result)
        for (auto &entry : subtask.testcases)
            if (auto detail = get_if<testcase_detail>(&entry); detail && !detail->show_in_restricted_feedback)
                entry = testcase_ref{detail->idx};
    return result;
}

vector<subtask_detail> localize_subtasks(const vector<subtask_detail> &subtasks, const translation &t) {
    vector<subtask_detail> result = subtasks;
    for (auto &subtask : result)
        for (auto &entry : subtask.testcases)
            visit(overloaded{
                      [&t](testcase_detail &detail) {
                          detail.outcome = t.gettext(detail.outcome);
                          detail.text = format_status_text(detail.text, t);
                      },
                      [](testcase_ref &) {}},
                  entry);
    return result;
}

}  // namespace scoring
