#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

/**
 * 这个头文件包含题目的静态评分配置
 * 包含：
 * 1. testcase 结构体（表示一个测试点及其可见性）
 * 2. dataset 结构体（表示一套测试数据及其 score type 配置）
 * 3. task 结构体（表示一道题目的评分选项）
 * 这些配置由导入题目的流程生成，评分引擎只读取，不修改。
 */
namespace scoring {

/**
 * @brief 选手能看到多少反馈
 */
enum class feedback_level {
    /**
     * @brief 公开测试点的所有信息都显示给选手
     */
    FULL,

    /**
     * @brief 子任务中第一个失败的公开测试点之后的测试点只显示编号
     */
    RESTRICTED
};

/**
 * @brief 选手在一道题上的多次提交如何合并成题目得分
 */
enum class score_mode {
    /**
     * @brief 取所有提交中总分最高的一次
     */
    MAX,

    /**
     * @brief 每个子任务分别取所有提交中的最高分，再求和
     */
    MAX_SUBTASK
};

/**
 * @brief 表示一个测试点
 */
struct testcase {
    /**
     * @brief 测试点的识别名，比如 "001"、"sub1-03"
     * 子任务通过识别名引用测试点，按识别名排序得到测试点的顺序
     */
    std::string codename;

    /**
     * @brief 测试点是否对选手公开
     * 非公开测试点的评测结果不会出现在公开反馈中
     */
    bool is_public = false;
};

/**
 * @brief 表示一套测试数据
 */
struct dataset {
    std::string description;

    /**
     * @brief score type 的名字，同时也是 reduction policy 的注册名
     * 比如 GroupMin、GroupMul、GroupSum
     */
    std::string score_type;

    /**
     * @brief score type 的参数，每个子任务一项
     * 格式为 [[weight, target, ...extra], ...]，其中 target 为测试点个数或者匹配识别名的正则表达式，
     * 若一项参数的长度至少为 3，最后一个元素为子任务标题。
     */
    nlohmann::json score_type_parameters;

    /**
     * @brief 所有测试点，按识别名排序
     */
    std::map<std::string, testcase> testcases;
};

/**
 * @brief 表示一道题目的评分选项
 */
struct task {
    std::string name;

    score_mode mode = score_mode::MAX;

    /**
     * @brief 题目总分保留的小数位数
     */
    int score_precision = 0;

    feedback_level feedback = feedback_level::FULL;

    dataset active_dataset;
};

void from_json(const nlohmann::json &j, testcase &tc);

void from_json(const nlohmann::json &j, dataset &data);

void from_json(const nlohmann::json &j, task &t);

/**
 * @brief 从 JSON 文件读取题目配置
 * @throw configuration_error 文件不存在、格式错误或者字段缺失
 */
task load_task(const std::filesystem::path &path);

}  // namespace scoring
