#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace scoring {

/**
 * @brief 表示一种语言的翻译
 * 显式地传给需要翻译的函数，而不是读取全局的语言设置，
 * 这样在测试中可以同时使用多种语言。
 */
struct translation {
    virtual ~translation();

    /**
     * @brief 翻译消息
     * @param msgid 原始消息（英文）
     * @return 翻译后的消息，没有对应翻译时返回 msgid
     */
    virtual std::string gettext(const std::string &msgid) const = 0;

    /**
     * @brief 语言名，如 en、it、zh_CN
     */
    virtual std::string identifier() const = 0;
};

/**
 * @brief 不做任何翻译，原样返回消息
 */
struct identity_translation : public translation {
    std::string gettext(const std::string &msgid) const override;

    std::string identifier() const override;
};

/**
 * @brief 基于翻译目录的翻译
 * 翻译目录的 JSON 格式为
 * @code{json}
 * {
 *   "locale": "it",
 *   "messages": {
 *     "Correct": "Corretto",
 *     "N/A": "N/D"
 *   }
 * }
 * @endcode
 */
struct catalog_translation : public translation {
    catalog_translation(std::string locale, std::map<std::string, std::string> messages);

    std::string gettext(const std::string &msgid) const override;

    std::string identifier() const override;

private:
    std::string locale;
    std::map<std::string, std::string> messages;
};

/**
 * @brief 默认翻译，即不翻译
 */
const translation &default_translation();

/**
 * @brief 读取翻译目录
 * @throw configuration_error 文件不存在或者格式错误
 */
std::unique_ptr<translation> load_translation(const std::filesystem::path &path);

/**
 * @brief 读取 locale_dir 下的 <locale>.json 翻译目录
 * locale 为空或者 en 时返回不翻译的 identity_translation
 * @throw configuration_error locale 名字不安全、文件不存在或者格式错误
 */
std::unique_ptr<translation> load_translation(const std::filesystem::path &locale_dir, const std::string &locale);

}  // namespace scoring
