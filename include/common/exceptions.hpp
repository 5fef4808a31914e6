#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace tutor {

struct tutor_exception : std::exception {
    tutor_exception();
    explicit tutor_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const tutor_exception &ex);

    template <typename T>
    tutor_exception operator<<(const T &t) const {
        return tutor_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

    /**
     * @brief 错误分类名，用于拼接返回给调用者的错误信息
     * 比如 "Execution error: SpawnError: ..."
     */
    virtual const char *category() const noexcept;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统自身的基础设施错误
 * 包括子进程创建失败、临时文件读写失败等，与选手代码无关。
 * 这类错误会在 process_runner 边界被捕获，转换为 SYSTEM_ERROR 的测试结果。
 */
struct infrastructure_error : public tutor_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);

    const char *category() const noexcept override;
};

/**
 * @brief 表示无法创建子进程（fork、pipe、exec 失败）
 */
struct spawn_error : public infrastructure_error {
    spawn_error();
    explicit spawn_error(const std::string &message);

    const char *category() const noexcept override;
};

/**
 * @brief 表示临时文件无法创建、写入或删除
 */
struct temp_file_error : public infrastructure_error {
    temp_file_error();
    explicit temp_file_error(const std::string &message);

    const char *category() const noexcept override;
};

/**
 * @brief 表示外部文本生成服务调用失败，通常由 CURL 产生
 * 该错误在 feedback_synthesizer 边界被捕获并替换为通用的反馈内容
 */
struct collaborator_error : public tutor_exception {
    collaborator_error();
    explicit collaborator_error(const std::string &message);

    const char *category() const noexcept override;
};

/**
 * @brief 表示嵌入的 Python 解释器在分析代码时出错（不包括语法错误）
 */
struct analysis_error : public tutor_exception {
    analysis_error();
    explicit analysis_error(const std::string &message);

    const char *category() const noexcept override;
};

}  // namespace tutor
