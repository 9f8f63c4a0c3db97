#include "chunking/text_merge.hpp"

#include <algorithm>
#include <sstream>

namespace {

std::string trim(std::string_view s) {
    auto a = s.find_first_not_of(" \t\n\r");
    if (a == std::string_view::npos) return {};
    auto b = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(a, b - a + 1));
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string w;
    while (in >> w) words.push_back(std::move(w));
    return words;
}

std::string join_words(const std::vector<std::string>& words, size_t from) {
    std::string out;
    for (size_t i = from; i < words.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

// Largest j <= k where the last j words of prev equal the first j of curr.
size_t seam_overlap(const std::vector<std::string>& prev, const std::vector<std::string>& curr,
                    size_t window_words) {
    size_t k = std::min({window_words, prev.size(), curr.size()});
    for (size_t j = k; j > 0; --j) {
        if (std::equal(prev.end() - static_cast<std::ptrdiff_t>(j), prev.end(), curr.begin())) {
            return j;
        }
    }
    return 0;
}

} // namespace

std::vector<std::string> render_window_texts(const std::vector<WindowText>& windows) {
    std::vector<std::string> out;
    out.reserve(windows.size());
    for (const auto& w : windows) {
        out.push_back(w ? *w : std::string(kInaudible));
    }
    return out;
}

std::string merge_chunk_texts(const std::vector<std::string>& texts, size_t window_words) {
    std::vector<std::string> kept;
    for (const auto& t : texts) {
        auto s = trim(t);
        if (s.empty() || s == kInaudible) continue;
        kept.push_back(std::move(s));
    }

    if (kept.empty()) return {};
    if (kept.size() == 1) return kept.front();

    std::vector<std::string> pieces{kept.front()};
    for (size_t i = 1; i < kept.size(); ++i) {
        auto prev = split_words(pieces.back());
        auto curr = split_words(kept[i]);

        if (prev.size() < 2 || curr.size() < 2) {
            pieces.push_back(kept[i]);
            continue;
        }

        size_t dup = seam_overlap(prev, curr, window_words);
        auto rest = dup ? join_words(curr, dup) : kept[i];
        if (!rest.empty()) pieces.push_back(std::move(rest));
    }

    std::string out;
    for (const auto& p : pieces) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}
