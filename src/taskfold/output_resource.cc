#include "output_resource.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

namespace Taskfold {

bool FileOutput::Open() {
    if (fd_.valid()) {
        LOG(WARNING) << "[FileOutput]: " << path_ << " already open";
        return true;
    }
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG(ERROR) << "[FileOutput]: failed to open " << path_ << ": " << strerror(errno);
        return false;
    }
    fd_.reset(fd);
    VLOG(1) << "[FileOutput]: opened " << path_;
    return true;
}

bool FileOutput::Write(const char* data, size_t len) {
    if (!fd_.valid()) {
        LOG(ERROR) << "[FileOutput]: write to " << path_ << " before open";
        return false;
    }
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd_.get(), data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG(ERROR) << "[FileOutput]: write to " << path_ << " failed: " << strerror(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool FileOutput::Flush() {
    if (!fd_.valid()) {
        return false;
    }
    if (::fdatasync(fd_.get()) != 0) {
        LOG(ERROR) << "[FileOutput]: fdatasync on " << path_ << " failed: " << strerror(errno);
        return false;
    }
    return true;
}

bool FileOutput::Close() {
    if (!fd_.valid()) {
        return true;
    }
    int fd = fd_.release();
    if (::close(fd) != 0) {
        LOG(ERROR) << "[FileOutput]: close of " << path_ << " failed: " << strerror(errno);
        return false;
    }
    VLOG(1) << "[FileOutput]: closed " << path_;
    return true;
}

} // namespace Taskfold
