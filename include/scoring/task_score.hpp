#pragma once

#include <vector>
#include "scoring/score_type.hpp"
#include "scoring/task.hpp"

namespace scoring {

/**
 * @brief 将选手在一道题上所有提交的分数合并为题目得分
 * MAX 取总分最高的提交；MAX_SUBTASK 对每个子任务取所有提交中的最高分再求和，
 * 没有评测结果的提交不贡献分数。
 * @param results 选手在这道题上所有已计算分数的提交
 * @param mode 合并方式
 * @param precision 结果保留的小数位数
 * @return 题目得分，没有提交时为 0
 */
double compute_task_score(const std::vector<score_result> &results, score_mode mode, int precision);

}  // namespace scoring
