#include "scoring/status_text.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/format.hpp>
#include <fmt/core.h>
#include <cmath>
#include <cstring>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace scoring {
using namespace std;
using namespace nlohmann;

// clang-format off
static const vector<pair<string, string>> simple_status_texts = {
    {"Evaluation didn't produce file",
     "Output file was not produced. Check you are creating the output file "
     "with name given in the problem statement. You may wish to use or consult the templates for this problem."},
    {"Execution timed out",
     "Time limit exceeded before your program finished. "
     "This may be due to an infinite loop/recursion, or your "
     "algorithm may be too slow for this subtask"},
    {"Execution killed",
     "Program crashed. Possibly due to accessing or requesting invalid memory "
     "(e.g. out-of-bounds array access)"},
    {"Execution failed because the return code was nonzero",
     "Your program did not finish successfully "
     "(return code nonzero). Possibly due to an Exception or Error being thrown."}};
// clang-format on

string get_simple_status_text(const string &status) {
    for (auto &[prefix, replacement] : simple_status_texts)
        if (boost::starts_with(status, prefix))
            return replacement;
    return status;
}

// printf 风格的占位符：%[(key)][flags][width][.precision][length]type
static const regex directive_pattern(R"(%(?:\([^)]*\))?[-+ #0]*(?:\*|\d+)?(?:\.(?:\*|\d+))?[hlL]?(.))");

/**
 * @brief 按顺序取出模板中每个占位符的转换类型，不包括 %%
 */
static vector<char> conversion_types(const string &format) {
    vector<char> types;
    for (sregex_iterator it(format.begin(), format.end(), directive_pattern), end; it != end; ++it) {
        char type = (*it)[1].str().front();
        if (type != '%') types.push_back(type);
    }
    return types;
}

static void feed_argument(boost::format &formatter, const json &arg, char type) {
    bool integral = type != '\0' && strchr("diouxX", type) != nullptr;
    bool floating = type != '\0' && strchr("eEfFgG", type) != nullptr;

    switch (arg.type()) {
        case json::value_t::string:
            if (integral || floating)
                throw invalid_argument(fmt::format("%{} requires a number, got a string", type));
            formatter % arg.get<string>();
            break;
        case json::value_t::number_integer:
        case json::value_t::boolean:
            if (floating)
                formatter % arg.get<double>();
            else if (arg.is_boolean() && !integral)
                formatter % (arg.get<bool>() ? "True" : "False");
            else
                formatter % arg.get<int64_t>();
            break;
        case json::value_t::number_unsigned:
            if (floating)
                formatter % arg.get<double>();
            else
                formatter % arg.get<uint64_t>();
            break;
        case json::value_t::number_float:
            if (integral)
                formatter % static_cast<int64_t>(trunc(arg.get<double>()));
            else
                formatter % arg.get<double>();
            break;
        default:
            throw invalid_argument(string("Unsupported status text argument of type ") + arg.type_name());
    }
}

string format_status_text(const json &status, const translation &t) {
    try {
        if (!status.is_array())
            throw invalid_argument(string("Invalid type: ") + status.type_name());

        string plain = get_simple_status_text(status.at(0).get<string>());
        string text = plain.empty() ? "" : t.gettext(plain);

        boost::format formatter(text);
        vector<char> types = conversion_types(text);
        for (size_t i = 1; i < status.size(); ++i)
            feed_argument(formatter, status[i], i - 1 < types.size() ? types[i - 1] : 's');
        return formatter.str();
    } catch (exception &e) {
        // 评测输出可能不是合法的 UTF-8
        LOG(ERROR) << "Unexpected error when formatting status text: "
                   << status.dump(-1, ' ', false, json::error_handler_t::replace) << endl
                   << boost::diagnostic_information(e);
        return t.gettext("N/A");
    }
}

}  // namespace scoring
