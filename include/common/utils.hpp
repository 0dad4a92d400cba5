#pragma once

#include <string>

/**
 * @brief 将小数四舍五入到指定的小数位数
 * @param value 要舍入的数
 * @param digits 保留的小数位数，可以为 0
 */
double round_to(double value, int digits);

/**
 * @brief 以最紧凑的形式输出分数，比如 18.0 输出 18，0.5 输出 0.5
 * 排行榜、子任务标题中的分数都使用这个格式
 */
std::string format_score(double value);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);
