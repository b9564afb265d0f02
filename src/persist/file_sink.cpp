#include "persist/file_sink.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {

PosixFileSink::~PosixFileSink() { close(); }

IoResult PosixFileSink::open(const std::string& path) noexcept {
    close();
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    fd_ = fd;
    size_bytes_ = 0;
    return {true, 0};
}

void PosixFileSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

IoResult PosixFileSink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    const ssize_t ret = ::writev(fd_, iov, iovcnt);
    if (ret < 0) {
        return {false, errno};
    }
    bytes_written = static_cast<std::size_t>(ret);
    size_bytes_ += static_cast<std::uint64_t>(ret);
    return {true, 0};
}

IoResult PosixFileSink::sync() noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::fdatasync(fd_) != 0) {
        return {false, errno};
    }
    return {true, 0};
}

IoResult write_fully(IFileSink& sink, const std::byte* buf, std::size_t len, std::uint64_t& partial_writes) noexcept {
    std::size_t done = 0;
    while (done < len) {
        struct iovec iov {
            const_cast<std::byte*>(buf + done), len - done
        };
        std::size_t written = 0;
        const IoResult r = sink.writev(&iov, 1, written);
        if (!r.ok) {
            if (r.error_code == EINTR) {
                continue;
            }
            return r;
        }
        if (written == 0) {
            return {false, EIO};
        }
        done += written;
        if (done < len) {
            ++partial_writes;
        }
    }
    return {true, 0};
}

} // namespace persist
