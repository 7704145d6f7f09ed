#include "judge/test_case.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace judgebox {
using namespace std;

static const string CASE_SEPARATOR = "\n===\n";
static const string OUTPUT_SEPARATOR = "\n--\n";

static test_case parse_test_case(const string &text) {
    test_case tc;
    size_t sep = text.find(OUTPUT_SEPARATOR);
    if (sep == string::npos) {
        tc.input = boost::algorithm::trim_copy(text);
    } else {
        tc.input = boost::algorithm::trim_copy(text.substr(0, sep));
        tc.expected_output = boost::algorithm::trim_copy(text.substr(sep + OUTPUT_SEPARATOR.size()));
    }
    return tc;
}

vector<test_case> parse_tests(const string &raw) {
    vector<test_case> cases;
    size_t start = 0;
    while (true) {
        size_t end = raw.find(CASE_SEPARATOR, start);
        if (end == string::npos) {
            cases.push_back(parse_test_case(raw.substr(start)));
            break;
        }
        cases.push_back(parse_test_case(raw.substr(start, end - start)));
        start = end + CASE_SEPARATOR.size();
    }
    return cases;
}

string normalize_input(const string &input) {
    return boost::algorithm::trim_copy(input) + "\n";
}

}  // namespace judgebox
