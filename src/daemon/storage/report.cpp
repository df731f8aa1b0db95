#include "storage/report.hpp"

#include "pipeline/text_rules.hpp"

#include <cctype>
#include <ctime>
#include <format>

namespace report {

namespace {

std::string cell(const std::string& s, size_t max_len = 80) {
    std::string out;
    for (char c : s) {
        if (c == '|') out += "\\|";
        else if (c == '\n' || c == '\r') out += ' ';
        else out += c;
    }
    if (out.size() > max_len) {
        out = std::string(text::utf8_prefix(out, max_len)) + "...";
    }
    return out;
}

std::string time_of(const std::string& timestamp) {
    // "YYYY-MM-DDTHH:MM:SS.sss" -> "HH:MM:SS"
    return timestamp.size() >= 19 ? timestamp.substr(11, 8) : timestamp;
}

double average(double sum, size_t n) {
    return n == 0 ? 0.0 : sum / static_cast<double>(n);
}

} // namespace

std::string today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
    return buf;
}

bool valid_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }
    return true;
}

std::string daily(const std::string& date, const std::vector<HistoryRecord>& sessions,
                  const std::vector<SpeechRecord>& speech) {
    size_t delivered = 0, fallbacks = 0, failed = 0, no_speech = 0, cancelled = 0;
    int64_t chars = 0, words = 0;
    double audio_s = 0.0, speed_sum = 0.0;
    size_t speed_n = 0;
    double transcribe_sum = 0.0, correct_sum = 0.0, deliver_sum = 0.0, total_sum = 0.0;
    size_t transcribe_n = 0, correct_n = 0, deliver_n = 0;

    for (auto& r : sessions) {
        if (r.outcome == "completed" || r.outcome == "correction_fallback") {
            ++delivered;
            chars += r.char_count;
            words += r.word_count;
            total_sum += r.total_ms;
            if (r.speed_ratio > 0.0) { speed_sum += r.speed_ratio; ++speed_n; }
        } else if (r.outcome == "no_speech") {
            ++no_speech;
        } else if (r.outcome == "cancelled" || r.outcome == "aborted") {
            ++cancelled;
        } else {
            ++failed;
        }
        if (r.correction_failed) ++fallbacks;
        audio_s += r.audio_duration_s;
        if (r.transcribe_ms > 0.0) { transcribe_sum += r.transcribe_ms; ++transcribe_n; }
        if (r.correct_ms > 0.0) { correct_sum += r.correct_ms; ++correct_n; }
        if (r.deliver_ms > 0.0) { deliver_sum += r.deliver_ms; ++deliver_n; }
    }

    std::string out = std::format("# Push-Dictate Report - {}\n\n", date);

    out += "## Summary\n\n";
    out += "| Metric | Value |\n|--------|-------|\n";
    out += std::format("| Sessions | {} |\n", sessions.size());
    out += std::format("| Delivered | {} |\n", delivered);
    out += std::format("| Correction fallbacks | {} |\n", fallbacks);
    out += std::format("| No speech | {} |\n", no_speech);
    out += std::format("| Failed | {} |\n", failed);
    out += std::format("| Cancelled or aborted | {} |\n", cancelled);
    out += std::format("| Characters | {} |\n", chars);
    out += std::format("| Words | {} |\n", words);
    out += std::format("| Audio time | {:.1f}s |\n", audio_s);
    out += std::format("| Avg speed ratio | {:.1f}x |\n\n", average(speed_sum, speed_n));

    out += "## Latency Averages\n\n";
    out += "| Stage | Avg (ms) |\n|-------|----------|\n";
    out += std::format("| Transcribe | {:.0f} |\n", average(transcribe_sum, transcribe_n));
    out += std::format("| Correct | {:.0f} |\n", average(correct_sum, correct_n));
    out += std::format("| Deliver | {:.0f} |\n", average(deliver_sum, deliver_n));
    out += std::format("| Total | {:.0f} |\n\n", average(total_sum, delivered));

    out += "## Transcription Log\n\n";
    if (sessions.empty()) {
        out += "No sessions recorded.\n";
    } else {
        out += "| Time | Trigger | Outcome | Audio | Total | Text |\n";
        out += "|------|---------|---------|-------|-------|------|\n";
        for (auto& r : sessions) {
            const std::string& text = r.delivered_text.empty() ? r.error : r.delivered_text;
            out += std::format("| {} | {} | {} | {:.1f}s | {:.0f}ms | {} |\n",
                               time_of(r.timestamp), r.trigger, r.outcome,
                               r.audio_duration_s, r.total_ms, cell(text));
        }
    }

    if (!speech.empty()) {
        size_t summarized = 0, spoken_cancelled = 0;
        int64_t reminders = 0;
        double synth_sum = 0.0;
        for (auto& s : speech) {
            if (s.summarized) ++summarized;
            if (s.cancelled) ++spoken_cancelled;
            reminders += s.reminder_count;
            synth_sum += s.synth_ms;
        }

        out += "\n## Speech Notifications\n\n";
        out += "| Metric | Value |\n|--------|-------|\n";
        out += std::format("| Events | {} |\n", speech.size());
        out += std::format("| Summarized | {} |\n", summarized);
        out += std::format("| Interrupted | {} |\n", spoken_cancelled);
        out += std::format("| Reminders fired | {} |\n", reminders);
        out += std::format("| Avg synthesis | {:.0f}ms |\n\n", average(synth_sum, speech.size()));

        out += "| Time | Event | Chars | Spoken |\n|------|-------|-------|--------|\n";
        for (auto& s : speech) {
            out += std::format("| {} | {} | {} | {} |\n", time_of(s.timestamp),
                               cell(s.event_type, 24), s.input_chars, cell(s.spoken_text));
        }
    }

    return out;
}

std::string date_list(const std::vector<std::string>& dates) {
    if (dates.empty()) return "No history recorded yet.\n";
    std::string out = "# Available Reports\n\n";
    for (auto& d : dates) {
        out += "- " + d + "\n";
    }
    return out;
}

std::expected<std::string, std::string> query(HistoryStore& store, const std::string& arg) {
    if (arg == "list") {
        return date_list(store.dates());
    }

    std::string date = (arg.empty() || arg == "today") ? today() : arg;
    if (!valid_date(date)) {
        return std::unexpected("invalid date '" + arg + "', expected YYYY-MM-DD, today or list");
    }
    return daily(date, store.on_date(date), store.speech_on_date(date));
}

} // namespace report
