#include "common/utils.hpp"
#include <fmt/core.h>
#include <cmath>
#include <cstdlib>
using namespace std;

double round_to(double value, int digits) {
    double scale = pow(10.0, digits);
    return round(value * scale) / scale;
}

string format_score(double value) {
    // -0 也显示为 0
    if (value == 0) value = 0;
    return fmt::format("{:g}", value);
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}
