#include "config.hpp"

namespace tutor {
using namespace std;

string PYTHON_EXECUTABLE = "python3";
filesystem::path TEMP_DIR = "/tmp";
string RUNNER_STRATEGY = "auto";
size_t MAX_OUTPUT_BYTES = 1 << 20;  // 1M
double DEFAULT_TIMEOUT_SECONDS = 10;
int DEFAULT_MEMORY_LIMIT_MB = 128;
size_t WORKER_COUNT = 4;
string LLM_BASE_URL = "https://integrate.api.nvidia.com/v1";
string LLM_MODEL = "meta/llama-4-scout-17b-16e-instruct";
string LLM_API_KEY;
double LLM_TEMPERATURE = 0.6;
long LLM_TIMEOUT_SECONDS = 30;
bool DEBUG = false;

}  // namespace tutor
