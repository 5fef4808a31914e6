#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace tutor {
using namespace std;

tutor_exception::tutor_exception()
    : tutor_exception("") {}

tutor_exception::tutor_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *tutor_exception::what() const noexcept {
    return message.c_str();
}

const char *tutor_exception::category() const noexcept {
    return "InternalError";
}

std::ostream &operator<<(std::ostream &os, const tutor_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

infrastructure_error::infrastructure_error()
    : tutor_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : tutor_exception(message) {}

const char *infrastructure_error::category() const noexcept {
    return "InfrastructureError";
}

spawn_error::spawn_error()
    : infrastructure_error() {}

spawn_error::spawn_error(const string &message)
    : infrastructure_error(message) {}

const char *spawn_error::category() const noexcept {
    return "SpawnError";
}

temp_file_error::temp_file_error()
    : infrastructure_error() {}

temp_file_error::temp_file_error(const string &message)
    : infrastructure_error(message) {}

const char *temp_file_error::category() const noexcept {
    return "TempFileError";
}

collaborator_error::collaborator_error()
    : tutor_exception() {}

collaborator_error::collaborator_error(const string &message)
    : tutor_exception(message) {}

const char *collaborator_error::category() const noexcept {
    return "CollaboratorError";
}

analysis_error::analysis_error()
    : tutor_exception() {}

analysis_error::analysis_error(const string &message)
    : tutor_exception(message) {}

const char *analysis_error::category() const noexcept {
    return "AnalysisError";
}

}  // namespace tutor
