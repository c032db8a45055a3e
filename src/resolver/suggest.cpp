#include "pqm/dependency_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace pqm {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

// True if the next non-whitespace character at or after `pos` is '('
bool followed_by_call(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    return pos < text.size() && text[pos] == '(';
}

// Index just past a "..." literal starting at `pos` ("" is an escaped quote)
size_t skip_string(const std::string& text, size_t pos) {
    size_t i = pos + 1;
    while (i < text.size()) {
        if (text[i] == '"') {
            if (i + 1 < text.size() && text[i + 1] == '"') {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return text.size();
}

} // namespace

std::vector<std::string> suggest_dependencies(const std::string& body,
                                              const std::vector<std::string>& known_names,
                                              const std::string& self_name) {
    std::unordered_map<std::string, std::string> known;  // folded -> declared
    for (const auto& name : known_names) {
        known.emplace(fold_name(name), name);
    }
    const std::string self_key = fold_name(self_name);

    std::set<std::string> found;  // folded keys
    auto consider = [&](const std::string& candidate) {
        std::string key = fold_name(candidate);
        if (key.empty() || key == self_key) return;
        if (known.count(key) > 0) found.insert(key);
    };

    size_t i = 0;
    while (i < body.size()) {
        char c = body[i];

        if (c == '/' && i + 1 < body.size() && body[i + 1] == '/') {
            size_t nl = body.find('\n', i);
            i = (nl == std::string::npos) ? body.size() : nl + 1;
            continue;
        }
        if (c == '/' && i + 1 < body.size() && body[i + 1] == '*') {
            size_t end = body.find("*/", i + 2);
            i = (end == std::string::npos) ? body.size() : end + 2;
            continue;
        }
        if (c == '#' && i + 1 < body.size() && body[i + 1] == '"') {
            size_t end = skip_string(body, i + 1);
            // Quoted identifier: #"Name With Spaces"
            size_t inner_len = (end > i + 3) ? end - i - 3 : 0;
            std::string name = body.substr(i + 2, inner_len);
            if (followed_by_call(body, end)) consider(name);
            i = end;
            continue;
        }
        if (c == '"') {
            i = skip_string(body, i);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < body.size() && is_ident_char(body[i])) ++i;
            continue;
        }
        if (is_ident_start(c)) {
            size_t start = i;
            while (i < body.size() && is_ident_char(body[i])) ++i;
            std::string ident = body.substr(start, i - start);
            while (!ident.empty() && ident.back() == '.') ident.pop_back();
            if (followed_by_call(body, i)) consider(ident);
            continue;
        }
        ++i;
    }

    std::vector<std::string> result;
    for (const auto& key : found) {
        result.push_back(known.at(key));
    }
    return result;
}

} // namespace pqm
