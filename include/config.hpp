#pragma once

#include <filesystem>
#include <string>

namespace scoring {

/**
 * @brief 存放翻译目录的文件夹，每种语言一个 JSON 文件
 * 
 * LOCALE_DIR
 * ├── it.json // {"locale": "it", "messages": {"Correct": "Corretto", ...}}
 * ├── zh_CN.json
 * └── ...
 */
extern std::filesystem::path LOCALE_DIR;

/**
 * @brief 默认语言，为空或者 "en" 时不翻译
 */
extern std::string DEFAULT_LOCALE;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后输出的 JSON 会缩进，并且会记录每个提交的计算过程
 */
extern bool DEBUG;

}  // namespace scoring
