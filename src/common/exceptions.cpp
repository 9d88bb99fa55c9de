#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace quizjudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

judge_exception::judge_exception(const string &message, const string &raw_output)
    : message(message), output(raw_output), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

judge_fault judge_exception::fault() const noexcept {
    return judge_fault::INTERNAL_ERROR;
}

const optional<string> &judge_exception::raw_output() const noexcept {
    return output;
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

allocation_error::allocation_error(const string &message)
    : judge_exception(message) {}

judge_fault allocation_error::fault() const noexcept {
    return judge_fault::ALLOCATION_ERROR;
}

permission_error::permission_error(const string &message)
    : judge_exception(message) {}

judge_fault permission_error::fault() const noexcept {
    return judge_fault::PERMISSION_DENIED;
}

asset_missing_error::asset_missing_error(const string &message)
    : judge_exception(message) {}

judge_fault asset_missing_error::fault() const noexcept {
    return judge_fault::ASSET_MISSING;
}

sandbox_unavailable_error::sandbox_unavailable_error(const string &message)
    : judge_exception(message) {}

judge_fault sandbox_unavailable_error::fault() const noexcept {
    return judge_fault::SANDBOX_UNAVAILABLE;
}

sandbox_fault::sandbox_fault(const string &message, int exitcode, const string &raw_output)
    : judge_exception(message, raw_output), exitcode(exitcode) {}

judge_fault sandbox_fault::fault() const noexcept {
    return judge_fault::SANDBOX_FAULT;
}

time_limit_exceeded::time_limit_exceeded(const string &message, const string &raw_output)
    : judge_exception(message, raw_output) {}

judge_fault time_limit_exceeded::fault() const noexcept {
    return judge_fault::TIME_LIMIT_EXCEEDED;
}

payload_parse_error::payload_parse_error(const string &message)
    : judge_exception(message) {}

payload_parse_error::payload_parse_error(const string &message, const string &raw_output)
    : judge_exception(message, raw_output) {}

judge_fault payload_parse_error::fault() const noexcept {
    return judge_fault::PAYLOAD_MALFORMED;
}

invalid_submission::invalid_submission(const string &message)
    : judge_exception(message) {}

judge_fault invalid_submission::fault() const noexcept {
    return judge_fault::INVALID_SUBMISSION;
}

}  // namespace quizjudge
