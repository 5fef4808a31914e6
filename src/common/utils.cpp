#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

namespace tutor {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    return lines;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
}

}  // namespace tutor
