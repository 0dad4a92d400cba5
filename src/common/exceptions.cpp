#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <utility>

namespace scoring {
using namespace std;

scoring_exception::scoring_exception()
    : scoring_exception("") {}

scoring_exception::scoring_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *scoring_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const scoring_exception &ex) {
    os << boost::diagnostic_information(ex) << endl;
    if (auto integrity = dynamic_cast<const data_integrity_error *>(&ex); integrity && !integrity->codename.empty())
        os << "Testcase: " << integrity->codename << endl;
    os << *ex.stacktrace;
    return os;
}

configuration_error::configuration_error()
    : scoring_exception() {}

configuration_error::configuration_error(const string &message)
    : scoring_exception(message) {}

data_integrity_error::data_integrity_error()
    : scoring_exception() {}

data_integrity_error::data_integrity_error(const string &message)
    : scoring_exception(message) {}

data_integrity_error::data_integrity_error(const string &message, string codename)
    : scoring_exception(message), codename(move(codename)) {}

}  // namespace scoring
