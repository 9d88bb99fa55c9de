#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace quizjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::CORRECT, "Correct")
    (status::INCORRECT, "Incorrect")
    (status::ERROR, "Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::CORRECT, "correct")
    (status::INCORRECT, "incorrect")
    (status::ERROR, "error");

static const unordered_map<judge_fault, const char *> fault_string = boost::assign::map_list_of
    (judge_fault::NONE, "None")
    (judge_fault::ALLOCATION_ERROR, "Workspace Allocation Error")
    (judge_fault::PERMISSION_DENIED, "Permission Denied")
    (judge_fault::ASSET_MISSING, "Harness Asset Missing")
    (judge_fault::SANDBOX_UNAVAILABLE, "Sandbox Unavailable")
    (judge_fault::SANDBOX_FAULT, "Runtime Error")
    (judge_fault::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (judge_fault::PAYLOAD_MALFORMED, "Malformed Output")
    (judge_fault::INVALID_SUBMISSION, "Invalid Submission")
    (judge_fault::QUERY_ERROR, "Query Error")
    (judge_fault::INTERNAL_ERROR, "System Error");

static const unordered_map<judge_fault, const char *> fault_name = boost::assign::map_list_of
    (judge_fault::NONE, "none")
    (judge_fault::ALLOCATION_ERROR, "allocation_error")
    (judge_fault::PERMISSION_DENIED, "permission_denied")
    (judge_fault::ASSET_MISSING, "asset_missing")
    (judge_fault::SANDBOX_UNAVAILABLE, "sandbox_unavailable")
    (judge_fault::SANDBOX_FAULT, "sandbox_fault")
    (judge_fault::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (judge_fault::PAYLOAD_MALFORMED, "payload_malformed")
    (judge_fault::INVALID_SUBMISSION, "invalid_submission")
    (judge_fault::QUERY_ERROR, "query_error")
    (judge_fault::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_display_message(judge_fault fault) {
    return fault_string.at(fault);
}

const char *get_name(status stat) {
    return status_name.at(stat);
}

const char *get_name(judge_fault fault) {
    return fault_name.at(fault);
}

status status_of(judge_fault fault) {
    switch (fault) {
        case judge_fault::NONE:
            return status::CORRECT;
        case judge_fault::SANDBOX_FAULT:
            return status::INCORRECT;
        default:
            return status::ERROR;
    }
}

}  // namespace quizjudge
