#pragma once

#include <string>
#include <vector>
#include "scoring/reduction_policy.hpp"
#include "scoring/score_type.hpp"

namespace scoring {

/**
 * @brief 按子任务分组计分的 score type
 * 每个子任务的得分为 reduction_policy::reduce 的结果乘以子任务的满分，
 * 总分为所有子任务得分之和。
 *
 * 参数格式为 [[weight, target, ...extra], ...]
 * - target 为整数时，将按识别名排序后的测试点依次分给各个子任务，所有子任务的测试点数之和必须等于测试点总数；
 * - target 为字符串时，识别名开头匹配该正则表达式的测试点属于该子任务；
 * - 所有子任务的 target 必须是同一种类型；
 * - 参数长度至少为 3 时，最后一个元素为子任务标题。
 */
struct group_score_type : public score_type {
    /**
     * @throw configuration_error 参数格式不对，或者有子任务匹配不到测试点
     */
    group_score_type(nlohmann::json parameters, std::map<std::string, testcase> testcases, const reduction_policy &policy);

    score_result compute_score(const submission_result &result) const override;

    double max_score() const override;

    double max_public_score() const override;

    std::vector<std::string> ranking_headers() const override;

    /**
     * @brief 每个子任务包含的测试点识别名
     */
    const std::vector<std::vector<std::string>> &subtask_targets() const;

private:
    const reduction_policy &policy;
    std::vector<std::vector<std::string>> targets;

    std::vector<std::vector<std::string>> retrieve_target_testcases() const;

    bool all_public(const std::vector<std::string> &target) const;
};

/**
 * @brief 计算子任务中每个测试点在 restricted 反馈等级下是否可以显示
 * 从前往后扫描，测试点能显示当且仅当排在它前面的公开测试点都没有失败，
 * 失败指的是 outcome 不高于子任务中最差的 outcome。
 * 非公开测试点失败不会影响后面的测试点，否则就泄露了非公开测试点的结果。
 * @param outcomes 子任务中各测试点的 outcome
 * @param is_public 子任务中各测试点是否公开，和 outcomes 一一对应
 * @throw std::invalid_argument outcomes 和 is_public 长度不同
 */
std::vector<bool> restricted_feedback_flags(const std::vector<double> &outcomes, const std::vector<bool> &is_public);

}  // namespace scoring
