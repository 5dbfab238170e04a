
#include "topic_matcher.hpp"
#include <vector>

namespace {

std::vector<std::string> split_words(const std::string& key) {
    std::vector<std::string> words;
    std::string::size_type start = 0;
    while (true) {
        auto dot = key.find('.', start);
        words.push_back(key.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return words;
}

bool match_words(const std::vector<std::string>& pattern, size_t p,
                 const std::vector<std::string>& words, size_t w) {
    while (p < pattern.size()) {
        if (pattern[p] == "#") {
            // Collapse consecutive '#'
            while (p + 1 < pattern.size() && pattern[p + 1] == "#") ++p;
            if (p + 1 == pattern.size()) return true;
            for (size_t skip = w; skip <= words.size(); ++skip) {
                if (match_words(pattern, p + 1, words, skip)) return true;
            }
            return false;
        }
        if (w >= words.size()) return false;
        if (pattern[p] != "*" && pattern[p] != words[w]) return false;
        ++p;
        ++w;
    }
    return w == words.size();
}

} // namespace

bool topic_matches(const std::string& binding_key, const std::string& routing_key) {
    auto pattern = split_words(binding_key);
    auto words = split_words(routing_key);
    return match_words(pattern, 0, words, 0);
}
