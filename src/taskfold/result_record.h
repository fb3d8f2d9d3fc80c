#ifndef TASKFOLD_RESULT_RECORD_H_
#define TASKFOLD_RESULT_RECORD_H_

#include <chrono>
#include <string>

namespace Taskfold {

/**
 * Result of processing one WorkItem. Moved from the producing worker into
 * the ResultSink, written out as a single line, then dropped.
 */
struct ResultRecord {
    std::chrono::system_clock::time_point timestamp;
    int worker_id = 0;
    int task_id = 0;
    std::string payload;
};

/**
 * ISO-8601 UTC with microsecond precision, e.g. 2026-10-19T12:34:56.123456Z
 */
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * Output line for a record, newline terminated:
 *   [<timestamp>] Worker-<worker_id> processed Task-<task_id> payload='<payload>'
 */
std::string FormatResultLine(const ResultRecord& record);

/**
 * Parses one output line (trailing newline optional) back into a record.
 * @return false if the line is not exactly one well-formed record
 */
bool ParseResultLine(const std::string& line, ResultRecord* record);

} // namespace Taskfold

#endif // TASKFOLD_RESULT_RECORD_H_
