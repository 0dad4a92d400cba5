#include "common/io_utils.hpp"
#include <fstream>
#include "common/exceptions.hpp"

namespace scoring {
using namespace std;
using namespace nlohmann;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

json read_json_file(filesystem::path const &path) {
    if (!filesystem::is_regular_file(path))
        throw configuration_error("Unable to find file " + path.string());
    try {
        return json::parse(read_file_content(path));
    } catch (json::parse_error &e) {
        throw configuration_error("Malformed JSON in " + path.string() + ": " + e.what());
    }
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath == ".." || subpath.find('/') != string::npos)
        throw configuration_error("subpath is not safe " + subpath);
    return subpath;
}

}  // namespace scoring
