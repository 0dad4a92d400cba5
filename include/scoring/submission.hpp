#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scoring {

/**
 * @brief 表示一个提交在一个测试点上的评测结果
 * 由评测后端产生，之后不再修改
 */
struct evaluation {
    /**
     * @brief 测试点的识别名
     */
    std::string codename;

    /**
     * @brief 测试点得分比例，一般在 [0, 1] 之间，但不强制截断
     */
    double outcome = 0;

    /**
     * @brief 状态文本，第一项为 printf 风格的模板，其余项为模板参数
     * @see format_status_text
     */
    nlohmann::json text = nlohmann::json::array();

    /**
     * @brief 选手程序运行用时，单位为秒
     */
    std::optional<double> execution_time;

    /**
     * @brief 选手程序运行使用的内存，单位为字节
     */
    std::optional<int64_t> execution_memory;
};

/**
 * @brief 表示一个提交在一套测试数据上的全部评测结果
 * 重测时整个对象会被替换，计算分数期间调用方需要保证不被修改。
 */
struct submission_result {
    /**
     * @brief 编译结果，"ok" 或 "fail"，还没编译时为空
     */
    std::optional<std::string> compilation_outcome;

    /**
     * @brief 编译信息，也是状态文本
     */
    nlohmann::json compilation_text = nlohmann::json::array();

    /**
     * @brief 评测完成后为 "ok"，编译失败的提交永远不会有评测结果
     */
    std::optional<std::string> evaluation_outcome;

    std::vector<evaluation> evaluations;

    bool compiled() const;

    bool evaluated() const;

    /**
     * @brief 按测试点识别名索引所有 evaluation
     * @throw data_integrity_error 同一个测试点出现多个 evaluation
     */
    std::map<std::string, const evaluation *> index_evaluations() const;
};

void from_json(const nlohmann::json &j, evaluation &ev);

void from_json(const nlohmann::json &j, submission_result &result);

/**
 * @brief 从 JSON 文件读取一个提交的评测结果
 * @throw configuration_error 文件不存在或者格式错误
 */
submission_result load_submission_result(const std::filesystem::path &path);

}  // namespace scoring
