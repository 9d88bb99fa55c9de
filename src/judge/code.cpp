#include "judge/code.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/normalizer.hpp"

namespace quizjudge {
using namespace std;

string code_judger::type() const {
    return "code";
}

bool code_judger::verify(const submission &submit, const test_spec &spec) const {
    return submit.lang == language::CODE && dynamic_cast<const code_test_spec *>(&spec);
}

verdict code_judger::judge(const submission &submit, const test_spec &spec) const {
    auto &code_spec = dynamic_cast<const code_test_spec &>(spec);
    if (code_spec.test_cases.empty())
        throw invalid_submission("Question has no test cases");

    // 模板缺失时不会分配工作目录
    harness h = generator.generate(submit, code_spec);
    auto &limits = limits_for(language::CODE);
    execution_result result = execute(submit, h, limits);
    return normalize_code(result, limits, code_spec);
}

}  // namespace quizjudge
