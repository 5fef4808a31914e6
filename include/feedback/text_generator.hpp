#pragma once

#include <string>

namespace tutor {

/**
 * @brief 外部文本生成服务
 * 输入提示词，返回生成的文本。该服务被视为不可靠的，调用者必须处理失败的情况。
 */
struct text_generator {
    virtual ~text_generator();

    /**
     * @brief 生成文本
     * @throw collaborator_error 服务不可用、超时或者返回了无法识别的内容
     */
    virtual std::string generate(const std::string &prompt) = 0;
};

/**
 * @brief 调用兼容 OpenAI chat completions 接口的文本生成服务
 * 使用 libcurl 发送 POST {base_url}/chat/completions 请求。
 */
class http_text_generator : public text_generator {
public:
    /**
     * @param base_url 服务地址，比如 https://integrate.api.nvidia.com/v1
     * @param model 模型名
     * @param api_key API Key，以 Bearer token 的形式发送
     * @param temperature 采样温度
     * @param timeout_seconds 整个请求的超时时间
     */
    http_text_generator(const std::string &base_url, const std::string &model, const std::string &api_key,
                        double temperature, long timeout_seconds);

    /**
     * @brief 使用 config.hpp 中的配置
     */
    http_text_generator();

    std::string generate(const std::string &prompt) override;

private:
    std::string base_url, model, api_key;
    double temperature;
    long timeout_seconds;
};

}  // namespace tutor
