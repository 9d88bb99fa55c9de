#include "judge/choice.hpp"
#include "judge/normalizer.hpp"

namespace quizjudge {
using namespace std;

string choice_judger::type() const {
    return "choice";
}

bool choice_judger::verify(const submission &submit, const test_spec &spec) const {
    return submit.lang == language::CHOICE && dynamic_cast<const choice_test_spec *>(&spec);
}

verdict choice_judger::judge(const submission &submit, const test_spec &spec) const {
    return judge_choice(submit, dynamic_cast<const choice_test_spec &>(spec));
}

}  // namespace quizjudge
