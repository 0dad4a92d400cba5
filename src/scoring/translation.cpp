#include "scoring/translation.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

translation::~translation() {}

string identity_translation::gettext(const string &msgid) const {
    return msgid;
}

string identity_translation::identifier() const {
    return "en";
}

catalog_translation::catalog_translation(string locale, map<string, string> messages)
    : locale(move(locale)), messages(move(messages)) {}

string catalog_translation::gettext(const string &msgid) const {
    auto it = messages.find(msgid);
    return it == messages.end() ? msgid : it->second;
}

string catalog_translation::identifier() const {
    return locale;
}

const translation &default_translation() {
    static identity_translation identity;
    return identity;
}

unique_ptr<translation> load_translation(const filesystem::path &path) {
    json catalog = read_json_file(path);
    try {
        auto locale = catalog.at("locale").get<string>();
        auto messages = catalog.at("messages").get<map<string, string>>();
        LOG(INFO) << "Loaded " << messages.size() << " messages for locale " << locale << " from " << path;
        return make_unique<catalog_translation>(move(locale), move(messages));
    } catch (json::exception &e) {
        throw configuration_error("Invalid translation catalog " + path.string() + ": " + e.what());
    }
}

unique_ptr<translation> load_translation(const filesystem::path &locale_dir, const string &locale) {
    if (locale.empty() || locale == "en")
        return make_unique<identity_translation>();
    return load_translation(locale_dir / (assert_safe_path(locale) + ".json"));
}

}  // namespace scoring
