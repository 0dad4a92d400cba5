#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "scoring/submission.hpp"
#include "scoring/task.hpp"

namespace scoring {

/**
 * @brief 一个测试点的完整反馈
 */
struct testcase_detail {
    /**
     * @brief 测试点识别名
     */
    std::string idx;

    /**
     * @brief 公开的评测结果，是可翻译的消息，如 "Correct"
     */
    std::string outcome;

    /**
     * @brief 状态文本，格式见 format_status_text
     */
    nlohmann::json text;

    std::optional<double> time;

    std::optional<int64_t> memory;

    /**
     * @brief 在 restricted 反馈等级下是否显示本测试点的详细信息
     * 只有当同一子任务中排在前面的公开测试点都没有失败时才为真
     */
    bool show_in_restricted_feedback = true;
};

/**
 * @brief 只有识别名的测试点反馈，用于不能公开详细信息的测试点
 */
struct testcase_ref {
    std::string idx;
};

using testcase_entry = std::variant<testcase_detail, testcase_ref>;

/**
 * @brief 一个子任务的反馈
 * 在公开反馈中，若子任务包含非公开测试点，则没有 score_fraction 和 max_score
 */
struct subtask_detail {
    /**
     * @brief 子任务编号，从 1 开始
     */
    int idx = 0;

    /**
     * @brief 子任务得分比例，乘以 max_score 得到子任务得分
     * 保存比例而不是分数，是为了让满分为 0 的样例子任务也能正确显示是否通过
     */
    std::optional<double> score_fraction;

    std::optional<double> max_score;

    std::vector<testcase_entry> testcases;

    std::optional<std::string> alt_title;
};

/**
 * @brief score_type::compute_score 的计算结果
 */
struct score_result {
    double score = 0;

    std::vector<subtask_detail> subtasks;

    /**
     * @brief 只根据公开测试点计算得到的分数，不会超过 score
     */
    double public_score = 0;

    std::vector<subtask_detail> public_subtasks;

    /**
     * @brief 每个子任务一项，排行榜中显示的子任务得分
     */
    std::vector<std::string> ranking_details;
};

void to_json(nlohmann::json &j, const testcase_detail &detail);

void to_json(nlohmann::json &j, const testcase_ref &ref);

void to_json(nlohmann::json &j, const testcase_entry &entry);

void to_json(nlohmann::json &j, const subtask_detail &detail);

void to_json(nlohmann::json &j, const score_result &result);

/**
 * @brief 表示一种计分方式
 * 根据提交的评测结果计算总分、子任务反馈、公开分数和排行榜信息。
 * score_type 在构造后不再修改，compute_score 可以并发调用。
 */
struct score_type {
    /**
     * @param parameters score type 参数
     * @param testcases 所有测试点，用于确定测试点是否公开
     */
    score_type(nlohmann::json parameters, std::map<std::string, testcase> testcases);

    virtual ~score_type();

    /**
     * @brief 计算提交的分数
     * 若提交没有评测结果（比如编译失败），返回 0 分和空的反馈，
     * 但 ranking_details 中每个子任务仍然有一项。
     * @throw data_integrity_error 子任务引用的测试点没有评测结果
     */
    virtual score_result compute_score(const submission_result &result) const = 0;

    /**
     * @brief 题目的满分
     */
    virtual double max_score() const = 0;

    /**
     * @brief 只考虑公开测试点时能得到的最高分
     */
    virtual double max_public_score() const = 0;

    /**
     * @brief 排行榜中每个子任务的表头
     */
    virtual std::vector<std::string> ranking_headers() const = 0;

    const nlohmann::json &parameters() const;

    bool is_public(const std::string &codename) const;

protected:
    nlohmann::json params;
    std::map<std::string, testcase> testcases;
};

/**
 * @brief 根据 dataset 中的 score_type 名字创建计分方式
 * @throw configuration_error 名字没有注册或者参数不合法
 */
std::unique_ptr<score_type> create_score_type(const dataset &data);

}  // namespace scoring
