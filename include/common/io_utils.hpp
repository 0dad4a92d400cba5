#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace scoring {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取并解析 JSON 文件
 * 任务配置、评测结果、翻译目录都是 JSON 文件
 * @param path JSON 文件路径
 * @throw configuration_error 文件不存在或者不是合法的 JSON
 */
nlohmann::json read_json_file(const std::filesystem::path &path);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 语言名是从命令行传进来拼接成翻译文件路径的，如果包含 "../"
 * 就可能读到 locale 目录以外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace scoring
