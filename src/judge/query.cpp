#include "judge/query.hpp"
#include "config.hpp"
#include "judge/normalizer.hpp"

namespace quizjudge {
using namespace std;

string query_judger::type() const {
    return "query";
}

bool query_judger::verify(const submission &submit, const test_spec &spec) const {
    return submit.lang == language::QUERY && dynamic_cast<const query_test_spec *>(&spec);
}

verdict query_judger::judge(const submission &submit, const test_spec &spec) const {
    auto &query_spec = dynamic_cast<const query_test_spec &>(spec);
    harness h = generator.generate(submit, query_spec);
    auto &limits = limits_for(language::QUERY);
    execution_result result = execute(submit, h, limits);
    return normalize_query(result, limits);
}

}  // namespace quizjudge
