#include "result_record.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <string_view>
#include <utility>

namespace Taskfold {

namespace {

constexpr std::string_view kWorkerTag = "] Worker-";
constexpr std::string_view kTaskTag = " processed Task-";
constexpr std::string_view kPayloadTag = " payload='";
// "YYYY-MM-DDTHH:MM:SS.ffffffZ"
constexpr size_t kTimestampLength = 27;

// Parses a positive decimal int starting at pos; advances pos past the digits.
bool ParsePositiveInt(std::string_view s, size_t& pos, int* out) {
    size_t start = pos;
    long long value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        value = value * 10 + (s[pos] - '0');
        if (value > 0x7fffffff) {
            return false;
        }
        ++pos;
    }
    if (pos == start || value <= 0) {
        return false;
    }
    *out = static_cast<int>(value);
    return true;
}

bool ParseTimestamp(std::string_view s, std::chrono::system_clock::time_point* tp) {
    if (s.size() != kTimestampLength || s[10] != 'T' || s[19] != '.' || s.back() != 'Z') {
        return false;
    }
    std::tm tm{};
    int year, mon, mday, hour, min, sec;
    long usec;
    std::string buf(s);
    char z = 0;
    if (std::sscanf(buf.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6ld%c",
                    &year, &mon, &mday, &hour, &min, &sec, &usec, &z) != 8 || z != 'Z') {
        return false;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = mday;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t secs = timegm(&tm);
    if (secs == static_cast<time_t>(-1)) {
        return false;
    }
    *tp = std::chrono::system_clock::from_time_t(secs) + std::chrono::microseconds(usec);
    return true;
}

} // namespace

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto usec = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);
    if (usec.count() < 0) {
        secs -= std::chrono::seconds(1);
        usec += std::chrono::seconds(1);
    }
    time_t t = static_cast<time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%06ldZ", static_cast<long>(usec.count()));
    return std::string(buf);
}

std::string FormatResultLine(const ResultRecord& record) {
    std::string line;
    line.reserve(kTimestampLength + record.payload.size() + 64);
    line += '[';
    line += FormatTimestamp(record.timestamp);
    line += kWorkerTag;
    line += std::to_string(record.worker_id);
    line += kTaskTag;
    line += std::to_string(record.task_id);
    line += kPayloadTag;
    line += record.payload;
    line += "'\n";
    return line;
}

bool ParseResultLine(const std::string& line, ResultRecord* record) {
    std::string_view s(line);
    if (!s.empty() && s.back() == '\n') {
        s.remove_suffix(1);
    }
    // A second newline means two records were spliced into one line.
    if (s.find('\n') != std::string_view::npos) {
        return false;
    }
    if (s.size() < 2 || s.front() != '[' || s.back() != '\'') {
        return false;
    }

    size_t close = s.find(kWorkerTag);
    if (close == std::string_view::npos) {
        return false;
    }
    ResultRecord parsed;
    if (!ParseTimestamp(s.substr(1, close - 1), &parsed.timestamp)) {
        return false;
    }

    size_t pos = close + kWorkerTag.size();
    if (!ParsePositiveInt(s, pos, &parsed.worker_id)) {
        return false;
    }
    if (s.substr(pos, kTaskTag.size()) != kTaskTag) {
        return false;
    }
    pos += kTaskTag.size();
    if (!ParsePositiveInt(s, pos, &parsed.task_id)) {
        return false;
    }
    if (s.substr(pos, kPayloadTag.size()) != kPayloadTag) {
        return false;
    }
    pos += kPayloadTag.size();
    if (pos > s.size() - 1) {
        return false;
    }
    std::string_view payload = s.substr(pos, s.size() - 1 - pos);
    // The worker tag inside the payload means a second record was spliced in.
    if (payload.find(kWorkerTag) != std::string_view::npos) {
        return false;
    }
    parsed.payload = std::string(payload);

    if (record != nullptr) {
        *record = std::move(parsed);
    }
    return true;
}

} // namespace Taskfold
