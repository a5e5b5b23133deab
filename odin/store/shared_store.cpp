#include "shared_store.hpp"

namespace NOdin {
namespace NStore {

bool GlobMatch(std::string_view pattern, std::string_view key) {
    if (pattern == "**") {
        return true;
    }
    if (pattern.ends_with(".**")) {
        auto prefix = pattern.substr(0, pattern.size() - 3);
        // the prefix must match a leading run of whole segments
        for (size_t pos = 0; pos <= key.size(); ++pos) {
            if (pos == key.size() || key[pos] == '.') {
                if (GlobMatch(prefix, key.substr(0, pos))) {
                    return true;
                }
            }
        }
        return false;
    }

    // iterative wildcard match with single backtrack point; '*' and '?' never cross '.'
    size_t p = 0, k = 0;
    size_t star = std::string_view::npos, mark = 0;
    while (k < key.size()) {
        if (p < pattern.size() && pattern[p] == '?' && key[k] != '.') {
            ++p;
            ++k;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = k;
        } else if (p < pattern.size() && pattern[p] == key[k]) {
            ++p;
            ++k;
        } else if (star != std::string_view::npos && key[mark] != '.') {
            p = star + 1;
            k = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace NStore
} // namespace NOdin
