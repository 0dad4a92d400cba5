#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "scoring/translation.hpp"

namespace scoring {

/**
 * @brief 将评测后端的常见错误信息替换成对选手更友好的说明
 * 按顺序检查前缀，第一个匹配的前缀生效，都不匹配时原样返回
 * @param status 状态文本的模板
 */
std::string get_simple_status_text(const std::string &status);

/**
 * @brief 将状态文本翻译并格式化为给用户看的字符串
 *
 * 状态文本是编译信息和测试点评测信息的存储格式，是一个 JSON 数组，
 * 第一项是带有 printf 风格占位符的模板，其余项按顺序填入占位符：
 * @code{json}
 * ["Execution completed successfully", ...]
 * ["Output is partially correct (%s)", "3/5"]
 * @endcode
 *
 * 模板先经过 get_simple_status_text 替换，再通过 translation 翻译，最后填入参数。
 * 空模板直接得到空字符串，不查翻译（翻译目录中空消息保留给目录的元信息）。
 *
 * 格式不对（不是非空数组、参数个数或类型和模板不符）时不会抛出异常，
 * 而是记录错误日志并返回翻译后的 "N/A"。
 * @param status 状态文本
 * @param t 使用的翻译
 */
std::string format_status_text(const nlohmann::json &status, const translation &t = default_translation());

}  // namespace scoring
