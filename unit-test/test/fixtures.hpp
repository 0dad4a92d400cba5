#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "scoring/submission.hpp"
#include "scoring/task.hpp"

/**
 * @brief 构造测试点表，pair 的第二项为测试点是否公开
 */
inline std::map<std::string, scoring::testcase> make_testcases(const std::vector<std::pair<std::string, bool>> &list) {
    std::map<std::string, scoring::testcase> testcases;
    for (auto &[codename, is_public] : list)
        testcases[codename] = scoring::testcase{codename, is_public};
    return testcases;
}

/**
 * @brief 构造一个已经评测完成的提交，pair 的第二项为测试点的 outcome
 */
inline scoring::submission_result make_evaluated(const std::vector<std::pair<std::string, double>> &outcomes) {
    scoring::submission_result result;
    result.compilation_outcome = "ok";
    result.compilation_text = nlohmann::json::array({"Compilation succeeded"});
    result.evaluation_outcome = "ok";
    for (auto &[codename, outcome] : outcomes) {
        scoring::evaluation ev;
        ev.codename = codename;
        ev.outcome = outcome;
        ev.text = outcome >= 1.0 ? nlohmann::json::array({"Output is correct"}) : nlohmann::json::array({"Output isn't correct"});
        ev.execution_time = 0.25;
        ev.execution_memory = 1 << 20;
        result.evaluations.push_back(ev);
    }
    return result;
}

/**
 * @brief 构造一个编译失败的提交
 */
inline scoring::submission_result make_compilation_failed() {
    scoring::submission_result result;
    result.compilation_outcome = "fail";
    result.compilation_text = nlohmann::json::array({"Compilation failed"});
    return result;
}
