#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace nlohmann {

namespace detail_utils {

/**
 * @brief 按 keys 依次向下查找 JSON 对象
 * 字符串键用于查找对象的成员，整数键用于查找数组的元素
 * @return 找到的节点，路径上任意一个键不存在时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        using key_type = std::decay_t<decltype(key)>;
        if constexpr (std::is_integral_v<key_type>) {
            if (ref && ref->is_array() && key >= 0 && static_cast<std::size_t>(key) < ref->size())
                ref = &ref->at(key);
            else
                ref = nullptr;
        } else {
            if (ref && ref->is_object() && ref->count(key))
                ref = &ref->at(key);
            else
                ref = nullptr;
        }
    };
    (step(keys), ...);
    return ref;
}

}  // namespace detail_utils

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_utils::find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = detail_utils::find_path(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = detail_utils::find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可以为 null 的字段
 * 字段不存在或为 null 时 value 被置为 std::nullopt
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, std::optional<T> &value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null())
        value.reset();
    else
        value = res.get<T>();
}

/**
 * @brief 写入可以为 null 的字段
 */
template <typename T>
json optional_to_json(const std::optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace nlohmann
