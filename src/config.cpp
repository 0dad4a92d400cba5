#include "config.hpp"

namespace scoring {

std::filesystem::path LOCALE_DIR = "locale";

std::string DEFAULT_LOCALE = "en";

bool DEBUG = false;

}  // namespace scoring
