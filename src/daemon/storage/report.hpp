#pragma once

#include "storage/history_store.hpp"

#include <expected>
#include <string>
#include <vector>

// Markdown reports over the history store.
namespace report {

std::string today();
bool valid_date(const std::string& date);

std::string daily(const std::string& date, const std::vector<HistoryRecord>& sessions,
                  const std::vector<SpeechRecord>& speech);

std::string date_list(const std::vector<std::string>& dates);

// arg: "list", "today" (or empty), or "YYYY-MM-DD".
std::expected<std::string, std::string> query(HistoryStore& store, const std::string& arg);

} // namespace report
