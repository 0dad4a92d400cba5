#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace scoring {

struct scoring_exception : std::exception {
    scoring_exception();
    explicit scoring_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const scoring_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示题目的评分配置有误
 * 比如 score type 的名字未注册、子任务参数格式不对、子任务匹配不到测试点。
 * 这类错误在构造 score_type 时就会抛出，而不会等到计算分数时才发现。
 */
struct configuration_error : public scoring_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示提交的评测数据不完整
 * 子任务引用的测试点在 submission_result 中没有对应的 evaluation，
 * 此时宁可报错也不能悄悄少算分数。
 */
struct data_integrity_error : public scoring_exception {
    data_integrity_error();
    explicit data_integrity_error(const std::string &message);
    data_integrity_error(const std::string &message, std::string codename);

    /**
     * @brief 出问题的测试点识别名，未知时为空
     */
    std::string codename;
};

}  // namespace scoring
