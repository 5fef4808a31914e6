#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace tutor {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将字节流按 UTF-8 解码，非法的字节序列替换为 U+FFFD
 * 子进程的输出是任意字节，可能被截断在多字节字符中间，
 * 也可能是选手程序故意输出的二进制数据。
 */
std::string utf8_sanitize(const std::string &bytes);

/**
 * @brief 计算 UTF-8 字符串的码点个数
 * 代码风格检查时，行长按字符而不是字节计算
 */
std::size_t utf8_length(const std::string &str);

/**
 * @brief 去掉字符串首尾的空白字符（包括换行），不改变中间的空白
 */
std::string trim_whitespace(const std::string &str);

/**
 * @brief 以唯一文件名创建的临时文件，对象析构时删除该文件
 * 文件名由随机 UUID 生成，并使用 O_EXCL 创建，因此并发评测的多个
 * 提交之间不会出现文件名冲突，也不需要加锁。
 */
struct scoped_temp_file {
    /**
     * @brief 在 dir 中创建临时文件并写入 content
     * @param dir 存放临时文件的文件夹，必须已经存在
     * @param suffix 文件后缀，比如 ".py"
     * @param content 要写入的文件内容
     * @throw temp_file_error 无法创建或写入文件
     */
    scoped_temp_file(const std::filesystem::path &dir, const std::string &suffix, const std::string &content);
    scoped_temp_file(scoped_temp_file &&other) noexcept;
    scoped_temp_file(const scoped_temp_file &) = delete;
    ~scoped_temp_file();

    scoped_temp_file &operator=(const scoped_temp_file &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 立刻删除临时文件
     * @param ec 删除失败时保存错误原因
     * @return 文件是否已经不存在
     */
    bool remove(std::error_code &ec) noexcept;

private:
    std::filesystem::path file;
    bool valid;
};

}  // namespace tutor
