#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "scoring/outcome.hpp"

namespace scoring {

/**
 * @brief 表示一种子任务的计分策略
 * 负责把子任务内所有测试点的 outcome 合并成子任务的得分比例，
 * 以及把单个测试点的 outcome 归类为公开的评测结果。
 *
 * 计分策略是无状态的，parameter 为该子任务的参数 [weight, target, ...extra]。
 * 同一个策略对象会被多个线程同时使用。
 */
struct reduction_policy {
    virtual ~reduction_policy();

    /**
     * @brief 策略的注册名，题目配置中的 score_type 通过这个名字选择策略
     */
    virtual std::string name() const = 0;

    /**
     * @brief 将子任务中所有测试点的 outcome 合并为子任务的得分比例
     * @param outcomes 子任务中各测试点的 outcome，按子任务中测试点的顺序，至少有一项
     * @param parameter 子任务的参数
     * @return 得分比例，outcome 都在 [0, 1] 内时结果也在 [0, 1] 内
     */
    virtual double reduce(const std::vector<double> &outcomes, const nlohmann::json &parameter) const = 0;

    /**
     * @brief 将单个测试点的 outcome 归类
     */
    virtual outcome_label classify(double outcome, const nlohmann::json &parameter) const = 0;

    /**
     * @brief 检查子任务参数是否符合本策略的要求
     * 默认要求 parameter 为 [weight, target, ...] 且 weight 为非负数
     * @throw configuration_error 参数格式不对
     */
    virtual void validate(const nlohmann::json &parameter) const;
};

/**
 * @brief 取最小值的计分策略
 * 子任务的得分比例为最差的测试点的 outcome，也就是必须通过所有测试点才能拿到子任务的满分。
 */
struct group_min_policy : public reduction_policy {
    std::string name() const override;

    double reduce(const std::vector<double> &outcomes, const nlohmann::json &parameter) const override;

    outcome_label classify(double outcome, const nlohmann::json &parameter) const override;
};

/**
 * @brief 取乘积的计分策略
 * 每个部分正确的测试点都会按比例削减子任务得分。
 */
struct group_mul_policy : public reduction_policy {
    std::string name() const override;

    double reduce(const std::vector<double> &outcomes, const nlohmann::json &parameter) const override;

    outcome_label classify(double outcome, const nlohmann::json &parameter) const override;
};

/**
 * @brief 取平均值的计分策略，子任务得分和通过的测试点数成正比
 */
struct group_sum_policy : public reduction_policy {
    std::string name() const override;

    double reduce(const std::vector<double> &outcomes, const nlohmann::json &parameter) const override;

    outcome_label classify(double outcome, const nlohmann::json &parameter) const override;
};

/**
 * @brief 按 outcome 的范围归类：<= 0 为不正确，>= 1 为正确，其余为部分正确
 */
outcome_label classify_by_range(double outcome);

/**
 * @brief 注册计分策略
 * 必须在开始计算分数之前完成注册，之后只读，因此查找时不需要加锁。
 * 同名策略只保留第一次注册的。
 */
void register_reduction_policy(std::unique_ptr<reduction_policy> &&policy);

/**
 * @brief 注册内置的计分策略 GroupMin、GroupMul、GroupSum，重复调用没有影响
 */
void register_builtin_reduction_policies();

/**
 * @brief 根据名字获取计分策略
 * @throw configuration_error 策略没有注册
 */
const reduction_policy &get_reduction_policy(const std::string &name);

}  // namespace scoring
