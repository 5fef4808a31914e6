#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace tutor {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 按换行符拆分字符串，保留空行
 * "a\n\nb" 拆分为 ["a", "", "b"]，空字符串拆分为 [""]
 */
std::vector<std::string> split_lines(const std::string &text);

/**
 * @brief 计时器，使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 从计时开始经过的毫秒数（带小数）
     */
    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace tutor
