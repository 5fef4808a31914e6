#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace tutor {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::SYSTEM_ERROR, "System Error")
    (status::CANCELLED, "Cancelled");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

status parse_status(const string &str) {
    for (auto &[stat, name] : status_string)
        if (str == name) return stat;
    throw out_of_range("Unrecognized status " + str);
}

}  // namespace tutor
