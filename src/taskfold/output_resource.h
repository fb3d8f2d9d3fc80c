#ifndef TASKFOLD_OUTPUT_RESOURCE_H_
#define TASKFOLD_OUTPUT_RESOURCE_H_

#include <cstddef>
#include <string>
#include <utility>

#include "common/scoped_fd.h"

namespace Taskfold {

/**
 * Append-only byte sink owned by exactly one ResultSink.
 * Every operation reports failure through its return value; none throws.
 */
class IOutputResource {
public:
    virtual ~IOutputResource() = default;

    virtual bool Open() = 0;
    // Writes all len bytes as one unit or reports failure.
    virtual bool Write(const char* data, size_t len) = 0;
    virtual bool Flush() = 0;
    virtual bool Close() = 0;
    // Human readable destination for log lines.
    virtual std::string Describe() const = 0;
};

/**
 * IOutputResource over a POSIX file, created (or truncated) on Open().
 */
class FileOutput : public IOutputResource {
public:
    explicit FileOutput(std::string path) : path_(std::move(path)) {}
    ~FileOutput() override = default;

    bool Open() override;
    bool Write(const char* data, size_t len) override;
    bool Flush() override;
    bool Close() override;
    std::string Describe() const override { return path_; }

private:
    std::string path_;
    ScopedFd fd_;
};

} // namespace Taskfold

#endif // TASKFOLD_OUTPUT_RESOURCE_H_
