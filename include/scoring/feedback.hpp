#pragma once

#include <vector>
#include "scoring/score_type.hpp"
#include "scoring/task.hpp"
#include "scoring/translation.hpp"

namespace scoring {

/**
 * @brief 根据题目的反馈等级裁剪公开反馈
 * FULL 时原样返回；RESTRICTED 时 show_in_restricted_feedback 为假的测试点只保留识别名。
 * 子任务的分数不受影响。
 */
std::vector<subtask_detail> apply_feedback_level(const std::vector<subtask_detail> &public_subtasks, feedback_level level);

/**
 * @brief 翻译反馈中的评测结果，并将状态文本格式化为字符串
 */
std::vector<subtask_detail> localize_subtasks(const std::vector<subtask_detail> &subtasks, const translation &t);

}  // namespace scoring
