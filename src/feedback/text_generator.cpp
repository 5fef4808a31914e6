#include "feedback/text_generator.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace tutor {
using namespace std;
using namespace nlohmann;

text_generator::~text_generator() = default;

http_text_generator::http_text_generator(const string &base_url, const string &model, const string &api_key,
                                         double temperature, long timeout_seconds)
    : base_url(base_url), model(model), api_key(api_key), temperature(temperature), timeout_seconds(timeout_seconds) {}

http_text_generator::http_text_generator()
    : http_text_generator(LLM_BASE_URL, LLM_MODEL, LLM_API_KEY, LLM_TEMPERATURE, LLM_TIMEOUT_SECONDS) {}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

string http_text_generator::generate(const string &prompt) {
    if (api_key.empty())
        throw collaborator_error("API key of text generation service is not configured");

    string url = base_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/chat/completions";

    json request = {{"model", model},
                    {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
                    {"temperature", temperature},
                    {"stream", false}};
    string body = request.dump(-1, ' ', false, json::error_handler_t::replace);
    string response;

    CURL *curl = curl_easy_init();
    if (!curl) throw collaborator_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, ("Authorization: Bearer " + api_key).c_str());
    defer { curl_slist_free_all(headers); };

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        throw collaborator_error(fmt::format("request to {} failed: {}", url, detail));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300)
        throw collaborator_error(fmt::format("request to {} failed with HTTP {}: {}", url, http_code, response.substr(0, 200)));

    try {
        json reply = json::parse(response);
        const json &content = access(reply, "choices", 0, "message", "content");
        DLOG(INFO) << "Text generation service replied " << content.get<string>().size() << " characters";
        return content.get<string>();
    } catch (std::exception &e) {
        throw collaborator_error(fmt::format("unrecognized response from {}: {}", url, e.what()));
    }
}

}  // namespace tutor
