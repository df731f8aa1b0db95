#pragma once

#include "settings.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

// Deterministic text handling around the transcribe and correct stages.
namespace text {

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
size_t word_count(std::string_view s);

// At most max_bytes of s, shortened so a UTF-8 sequence is never split.
std::string_view utf8_prefix(std::string_view s, size_t max_bytes);

// Case-insensitive, whole-word replacement of every dictionary key by its
// value. Longer keys are applied first.
std::string apply_corrections(std::string_view input,
                              const std::map<std::string, std::string>& dictionary);

// Phrases speech models emit for silence or noise.
bool is_hallucination(std::string_view transcript);

// The transcript a session settles on: corrected text when correction ran
// and produced something, the raw text otherwise.
std::string select_final(const std::string& raw, const std::string& corrected,
                         bool correction_succeeded);

// What is actually typed, given the output mode.
std::string format_delivery(OutputMode mode, const std::string& raw,
                            const std::string& final_text);

// Splits "a, b ,c" into trimmed, non-empty terms.
std::vector<std::string> split_terms(std::string_view list);

// Appends terms not already present (case-insensitive). Returns the number added.
size_t merge_terms(std::vector<std::string>& vocabulary, const std::vector<std::string>& terms);

} // namespace text
