#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_utils {

template <typename Key>
void step(const json *&ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        ref = &ref->at(key);
    else
        ref = nullptr;
}

template <typename... Keys>
const json *walk(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    (step(ref, keys), ...);
    return ref;
}

}  // namespace detail_utils

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_utils::walk(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = detail_utils::walk(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

/**
 * @brief 读取可选字段，字段不存在或者为 null 时返回 std::nullopt
 * @note 字段存在但类型不对时抛出 std::invalid_argument
 */
template <typename T, typename... Keys>
std::optional<T> get_optional(const json &j, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return std::nullopt;
    try {
        return res.get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选字段，字段不存在或者为 null 时返回 def_value
 * @note 字段存在但类型不对时视为配置错误，抛出 std::invalid_argument
 */
template <typename T, typename... Keys>
const T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::type_error &e) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
