#include "scoring/outcome.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace scoring {
using namespace std;

// clang-format off
static const unordered_map<outcome_label, const char *> message_keys = boost::assign::map_list_of
    (outcome_label::NOT_CORRECT, "Not correct")
    (outcome_label::PARTIALLY_CORRECT, "Partially correct")
    (outcome_label::CORRECT, "Correct");
// clang-format on

const char *get_message_key(outcome_label label) {
    return message_keys.at(label);
}

}  // namespace scoring
