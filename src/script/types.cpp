#include "pqm/types.hpp"

#include <algorithm>
#include <cctype>

namespace pqm {

bool operator==(const ScriptMetadata& a, const ScriptMetadata& b) {
    return a.name == b.name &&
           a.category == b.category &&
           a.tags == b.tags &&
           a.dependencies == b.dependencies &&
           a.description == b.description &&
           a.version == b.version;
}

bool operator==(const IndexEntry& a, const IndexEntry& b) {
    return a.meta == b.meta && a.path == b.path && a.sha256 == b.sha256;
}

std::string fold_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool same_name(const std::string& a, const std::string& b) {
    return a.size() == b.size() && fold_name(a) == fold_name(b);
}

} // namespace pqm
