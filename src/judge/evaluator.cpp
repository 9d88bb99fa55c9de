#include "judge/evaluator.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "judge/choice.hpp"
#include "judge/code.hpp"
#include "judge/query.hpp"

namespace quizjudge {
using namespace std;

evaluator::evaluator(const workspace_manager &workspaces, const sandbox_runner &runner, const harness_generator &generator) {
    judgers[language::CODE] = make_unique<code_judger>(workspaces, runner, generator);
    judgers[language::QUERY] = make_unique<query_judger>(workspaces, runner, generator);
    judgers[language::CHOICE] = make_unique<choice_judger>();
}

const judger &evaluator::get_judger(language lang) const {
    auto it = judgers.find(lang);
    if (it == judgers.end())
        throw invalid_submission(fmt::format("No judger for submission type {}", get_name(lang)));
    return *it->second;
}

verdict evaluator::evaluate_impl(const submission &submit, const test_spec &spec) const {
    if (spec.language() != submit.lang)
        throw invalid_submission(fmt::format("Submission of type {} cannot be checked against a {} test spec",
                                             get_name(submit.lang), get_name(spec.language())));
    auto &j = get_judger(submit.lang);
    if (!j.verify(submit, spec))
        throw invalid_submission(fmt::format("Submission is not acceptable by {} judger", j.type()));
    LOG(INFO) << "Judging " << submit;
    return j.judge(submit, spec);
}

verdict evaluator::evaluate(const submission &submit, const test_spec &spec) const noexcept {
    verdict v;
    try {
        v = evaluate_impl(submit, spec);
    } catch (judge_exception &ex) {
        if (ex.fault() == judge_fault::INTERNAL_ERROR)
            LOG(ERROR) << "Judging " << submit << " failed: " << ex;
        else
            LOG(WARNING) << "Judging " << submit << " failed with " << get_name(ex.fault()) << ": " << ex.what();
        v = make_fault_verdict(ex.fault(), ex.what(), ex.raw_output());
    } catch (exception &ex) {
        LOG(ERROR) << "Judging " << submit << " failed with unexpected error: " << ex.what();
        v = make_fault_verdict(judge_fault::INTERNAL_ERROR, fmt::format("Internal error: {}", ex.what()));
    }
    v.category = submit.category;
    v.prob_id = submit.prob_id;
    v.sub_id = submit.sub_id;
    LOG(INFO) << submit << " judged: " << get_name(v.status);
    return v;
}

}  // namespace quizjudge
