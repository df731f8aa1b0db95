#include "pipeline/text_rules.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace text {

namespace {

constexpr std::array<std::string_view, 13> kHallucinations = {
    "thank you", "thank you.", "thanks", "thanks.",
    "thanks for watching", "thanks for watching.",
    "subscribe", "like and subscribe",
    "you", "bye", "bye.", "goodbye", "goodbye.",
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\'';
}

} // namespace

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

size_t word_count(std::string_view s) {
    size_t count = 0;
    bool in_word = false;
    for (char c : s) {
        bool space = std::isspace(static_cast<unsigned char>(c));
        if (!space && !in_word) ++count;
        in_word = !space;
    }
    return count;
}

std::string_view utf8_prefix(std::string_view s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t end = max_bytes;
    // Back off continuation bytes (10xxxxxx) to the start of the character.
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) --end;
    return s.substr(0, end);
}

std::string apply_corrections(std::string_view input,
                              const std::map<std::string, std::string>& dictionary) {
    std::vector<std::pair<std::string, const std::string*>> rules;
    for (auto& [wrong, right] : dictionary) {
        if (!wrong.empty()) rules.emplace_back(to_lower(wrong), &right);
    }
    std::ranges::sort(rules, [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });

    std::string out(input);
    for (auto& [needle, replacement] : rules) {
        std::string lowered = to_lower(out);
        std::string result;
        size_t pos = 0;
        while (true) {
            size_t hit = lowered.find(needle, pos);
            if (hit == std::string::npos) break;

            size_t after = hit + needle.size();
            bool left_ok = hit == 0 || !is_word_char(needle.front()) || !is_word_char(lowered[hit - 1]);
            bool right_ok = after >= lowered.size() || !is_word_char(needle.back()) ||
                            !is_word_char(lowered[after]);
            if (left_ok && right_ok) {
                result.append(out, pos, hit - pos);
                result += *replacement;
            } else {
                result.append(out, pos, after - pos);
            }
            pos = after;
        }
        result.append(out, pos, std::string::npos);
        out = std::move(result);
    }
    return out;
}

bool is_hallucination(std::string_view transcript) {
    auto normalized = to_lower(trim(transcript));
    return std::ranges::find(kHallucinations, std::string_view(normalized)) != kHallucinations.end();
}

std::string select_final(const std::string& raw, const std::string& corrected,
                         bool correction_succeeded) {
    if (correction_succeeded && !corrected.empty()) return corrected;
    return raw;
}

std::string format_delivery(OutputMode mode, const std::string& raw, const std::string& final_text) {
    switch (mode) {
        case OutputMode::RawOnly:
            return raw;
        case OutputMode::CorrectedOnly:
            return final_text;
        case OutputMode::Both:
            if (final_text == raw) return final_text;
            return final_text + " [" + raw + "]";
    }
    return final_text;
}

std::vector<std::string> split_terms(std::string_view list) {
    std::vector<std::string> terms;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string_view::npos) comma = list.size();
        auto term = trim(list.substr(pos, comma - pos));
        if (!term.empty()) terms.push_back(std::move(term));
        pos = comma + 1;
    }
    return terms;
}

size_t merge_terms(std::vector<std::string>& vocabulary, const std::vector<std::string>& terms) {
    size_t added = 0;
    for (auto& term : terms) {
        auto lowered = to_lower(term);
        bool present = std::ranges::any_of(vocabulary, [&](const std::string& existing) {
            return to_lower(existing) == lowered;
        });
        if (!present) {
            vocabulary.push_back(term);
            ++added;
        }
    }
    return added;
}

} // namespace text
