#include "speech/transcript_filter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <vector>

namespace transcript {

namespace {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Lowercased words with surrounding punctuation stripped.
std::vector<std::string> words(std::string_view text) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&] {
        if (!cur.empty()) out.push_back(std::move(cur));
        cur.clear();
    };
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            flush();
        } else if (std::isalnum(uc) || uc >= 0x80 || c == '\'') {
            cur += static_cast<char>(std::tolower(uc));
        }
    }
    flush();
    return out;
}

constexpr std::array SILENCE_MARKERS = {
    "[blank_audio]", "[silence]", "(silence)", "[no speech]", "(no speech)",
    "[music]", "(music)", "[inaudible]", "(inaudible)", "[ silence ]",
};

} // namespace

bool is_silence_marker(std::string_view text) {
    auto t = lower(trim(text));
    for (auto* m : SILENCE_MARKERS) {
        if (t == m) return true;
    }
    // Output made only of bracketed annotations, e.g. "[BLANK_AUDIO] [MUSIC]".
    if (!t.empty() && (t.front() == '[' || t.front() == '(')) {
        int depth = 0;
        for (char c : t) {
            if (c == '[' || c == '(') ++depth;
            else if (c == ']' || c == ')') --depth;
            else if (depth == 0 && !std::isspace(static_cast<unsigned char>(c))) return false;
        }
        return depth == 0;
    }
    return false;
}

bool is_repetitive(std::string_view text) {
    auto w = words(text);
    if (w.size() < 6) return false;

    size_t run = 1;
    for (size_t i = 1; i < w.size(); ++i) {
        run = (w[i] == w[i - 1]) ? run + 1 : 1;
        if (run >= 6) return true;
    }

    if (w.size() >= 8) {
        std::map<std::string, size_t> counts;
        for (auto& word : w) ++counts[word];
        for (auto& [word, n] : counts) {
            if (n * 2 > w.size()) return true;
        }
    }
    return false;
}

std::string clean(std::string_view text) {
    auto t = trim(text);
    if (t.empty() || is_silence_marker(t) || is_repetitive(t)) return {};
    return std::string(t);
}

void append(std::string& out, std::string_view part) {
    if (part.empty()) return;
    if (!out.empty()) out += ' ';
    out += part;
}

} // namespace transcript
