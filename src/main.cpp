#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <iostream>
#include <nlohmann/json.hpp>
#include "analysis/code_analyzer.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/execution_service.hpp"
#include "runner/process_runner.hpp"
using namespace std;
using namespace nlohmann;

static atomic<bool> interrupted(false);

void sigintHandler(int /* signum */) {
    interrupted = true;
}

/**
 * @brief 一个评测任务：执行请求、学生信息以及期望掌握的概念
 * 
 * 任务文件的格式为：
 * @code{.json}
 * {
 *   "request": {"code": "print(input())", "lessonId": "lesson-1", "testCases": [...]},
 *   "learner": {"name": "Alice", "age": 12, "experience": "beginner"},
 *   "expectedConcepts": ["variables", "input"]
 * }
 * @endcode
 * 没有 request 字段时，整个文件被视为执行请求。
 */
struct job {
    string source;
    tutor::execution_request request;
    tutor::learner_profile learner;
    vector<string> expected_concepts;
    string error;
};

static job load_job(const string &source) {
    job j;
    j.source = source;
    try {
        string content;
        if (source == "-") {
            content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        } else {
            if (!filesystem::is_regular_file(source))
                throw invalid_argument("Job file " + source + " does not exist");
            content = tutor::read_file_content(source);
        }

        json document = json::parse(content);
        if (exists(document, "request")) {
            document.at("request").get_to(j.request);
            if (exists(document, "learner"))
                document.at("learner").get_to(j.learner);
            j.expected_concepts = get_value_def<vector<string>>(document, {}, "expectedConcepts");
        } else {
            document.get_to(j.request);
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to load job " << source << ": " << e.what();
        j.error = e.what();
    }
    return j;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    curl_global_init(CURL_GLOBAL_DEFAULT);
    tutor::python_interpreter interpreter(argv[0]);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("tutor-judge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("job", po::value<vector<string>>(), "job files to evaluate, \"-\" for stdin. Read stdin if no job file is given.")
        ("python", po::value<string>(), "set the Python interpreter running submissions, default to python3. You can either pass it from environ PYTHON")
        ("temp-dir", po::value<string>(), "set the directory to store submission files temporarily. You can either pass it from environ TMPDIR")
        ("runner", po::value<string>(), "set the process runner strategy: auto, poll or thread. You can either pass it from environ RUNNER_STRATEGY")
        ("workers", po::value<size_t>(), "set the number of concurrent execution workers, default to 4")
        ("timeout", po::value<double>(), "set the default time limit in seconds of each test case, default to 10")
        ("max-output", po::value<size_t>(), "set the maximum bytes of stdout and stderr to keep, default to 1048576")
        ("llm-base-url", po::value<string>(), "set the base url of the text generation service. You can either pass it from environ LLM_BASE_URL")
        ("llm-model", po::value<string>(), "set the model of the text generation service. You can either pass it from environ LLM_MODEL")
        ("llm-timeout", po::value<long>(), "set the timeout in seconds of text generation requests, default to 30")
        ("execute-only", "only run test cases, skip code analysis and feedback")
        ("debug", "turn on the debug mode to output verbose logs")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("job", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "tutor-judge: Run student Python submissions against test cases, analyze them and generate feedback" << endl
             << "Optional Environment Variables:" << endl
             << "\tNVIDIA_NIM_API_KEY: API key of the text generation service, fallback feedback is used if not set" << endl
             << "Usage: " << argv[0] << " [options] [job files...]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "tutor-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        tutor::DEBUG = true;
        FLAGS_v = 1;
    }

    if (vm.count("python")) {
        tutor::PYTHON_EXECUTABLE = vm.at("python").as<string>();
    } else if (getenv("PYTHON")) {
        tutor::PYTHON_EXECUTABLE = getenv("PYTHON");
    }

    if (vm.count("temp-dir")) {
        tutor::TEMP_DIR = filesystem::path(vm.at("temp-dir").as<string>());
    } else if (getenv("TMPDIR")) {
        tutor::TEMP_DIR = filesystem::path(getenv("TMPDIR"));
    }
    CHECK(filesystem::is_directory(tutor::TEMP_DIR))
        << "Temp directory " << tutor::TEMP_DIR << " does not exist";

    if (vm.count("runner")) {
        tutor::RUNNER_STRATEGY = vm.at("runner").as<string>();
    } else if (getenv("RUNNER_STRATEGY")) {
        tutor::RUNNER_STRATEGY = getenv("RUNNER_STRATEGY");
    }

    if (vm.count("workers"))
        tutor::WORKER_COUNT = vm.at("workers").as<size_t>();

    if (vm.count("timeout"))
        tutor::DEFAULT_TIMEOUT_SECONDS = vm.at("timeout").as<double>();
    CHECK(tutor::DEFAULT_TIMEOUT_SECONDS > 0) << "Default timeout should be positive";

    if (vm.count("max-output"))
        tutor::MAX_OUTPUT_BYTES = vm.at("max-output").as<size_t>();

    if (vm.count("llm-base-url")) {
        tutor::LLM_BASE_URL = vm.at("llm-base-url").as<string>();
    } else if (getenv("LLM_BASE_URL")) {
        tutor::LLM_BASE_URL = getenv("LLM_BASE_URL");
    }

    if (vm.count("llm-model")) {
        tutor::LLM_MODEL = vm.at("llm-model").as<string>();
    } else if (getenv("LLM_MODEL")) {
        tutor::LLM_MODEL = getenv("LLM_MODEL");
    }

    if (vm.count("llm-timeout"))
        tutor::LLM_TIMEOUT_SECONDS = vm.at("llm-timeout").as<long>();

    tutor::LLM_API_KEY = tutor::get_env("NVIDIA_NIM_API_KEY", "");

    unique_ptr<tutor::process_runner> runner;
    try {
        runner = tutor::make_process_runner();
    } catch (std::exception &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    unique_ptr<tutor::text_generator> generator;
    if (!tutor::LLM_API_KEY.empty())
        generator = make_unique<tutor::http_text_generator>();
    else
        LOG(WARNING) << "NVIDIA_NIM_API_KEY is not set, feedback will use fallback content";
    tutor::code_analyzer analyzer(generator.get());

    vector<string> sources = {"-"};
    if (vm.count("job")) sources = vm.at("job").as<vector<string>>();

    vector<job> jobs;
    for (auto &source : sources) jobs.push_back(load_job(source));

    int exit_code = EXIT_SUCCESS;
    {
        tutor::execution_service service(*runner, tutor::WORKER_COUNT);

        // 所有任务并发执行，按参数顺序输出
        vector<optional<tutor::submission_handle>> handles;
        for (auto &j : jobs) {
            if (j.error.empty())
                handles.push_back(service.submit(j.request));
            else
                handles.push_back(nullopt);
        }

        bool cancelled = false;
        for (size_t i = 0; i < jobs.size(); ++i) {
            json output = {{"job", jobs[i].source}};
            if (!handles[i]) {
                output["error"] = jobs[i].error;
                exit_code = EXIT_FAILURE;
                cout << output.dump(2) << endl;
                continue;
            }

            auto &response = handles[i]->response;
            while (response.wait_for(tutor::POLL_SLICE) != future_status::ready) {
                if (interrupted && !cancelled) {
                    LOG(ERROR) << "Received interrupt signal, cancelling all jobs";
                    for (auto &handle : handles)
                        if (handle) handle->cancel();
                    cancelled = true;
                }
            }

            tutor::execution_response execution = response.get();
            output["execution"] = execution;
            if (!vm.count("execute-only")) {
                tutor::analysis_report report = analyzer.analyze(jobs[i].request.code, jobs[i].request.lesson_id, execution,
                                                                 jobs[i].learner, jobs[i].expected_concepts);
                output["analysis"] = report;
            }
            cout << output.dump(2, ' ', false, json::error_handler_t::replace) << endl;
        }
    }

    curl_global_cleanup();
    return interrupted ? EXIT_FAILURE : exit_code;
}
