#pragma once

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "persist/file_sink.hpp"

namespace test_harness {

class FakeFileSink : public persist::IFileSink {
public:
    explicit FakeFileSink(std::size_t limit = std::numeric_limits<std::size_t>::max(),
                          bool inject_eintr = false)
        : limit_per_call_(limit), inject_eintr_(inject_eintr) {}

    persist::IoResult open(const std::string& path) noexcept override {
        if (fail_open_) {
            return {false, EACCES};
        }
        path_ = path;
        open_ = true;
        data_.clear();
        return {true, 0};
    }

    void close() noexcept override { open_ = false; }

    persist::IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override {
        bytes_written = 0;
        if (!open_) {
            return {false, EBADF};
        }
        if (inject_eintr_) {
            inject_eintr_ = false;
            return {false, EINTR};
        }
        if (fail_after_bytes_ != npos && size_bytes_ >= fail_after_bytes_) {
            return {false, ENOSPC};
        }
        std::size_t remaining = limit_per_call_;
        for (int i = 0; i < iovcnt && remaining > 0; ++i) {
            const std::size_t take = std::min<std::size_t>(remaining, iov[i].iov_len);
            const auto* bytes = static_cast<const std::byte*>(iov[i].iov_base);
            data_.insert(data_.end(), bytes, bytes + take);
            bytes_written += take;
            remaining -= take;
            if (take < iov[i].iov_len) {
                break;
            }
        }
        size_bytes_ += bytes_written;
        return {true, 0};
    }

    persist::IoResult sync() noexcept override {
        ++syncs_;
        return {true, 0};
    }

    std::uint64_t current_size() const noexcept override { return size_bytes_; }
    bool is_open() const noexcept override { return open_; }

    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    std::vector<std::byte> data_;
    std::string path_;
    std::size_t limit_per_call_;
    bool inject_eintr_{false};
    bool fail_open_{false};
    std::size_t fail_after_bytes_{npos};
    bool open_{false};
    std::uint64_t size_bytes_{0};
    int syncs_{0};
};

// Lets a test keep inspecting the sink after the writer has dropped it.
class HolderSink : public persist::IFileSink {
public:
    explicit HolderSink(std::shared_ptr<FakeFileSink> impl) : impl_(std::move(impl)) {}

    persist::IoResult open(const std::string& path) noexcept override { return impl_->open(path); }
    void close() noexcept override { impl_->close(); }
    persist::IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override {
        return impl_->writev(iov, iovcnt, bytes_written);
    }
    persist::IoResult sync() noexcept override { return impl_->sync(); }
    std::uint64_t current_size() const noexcept override { return impl_->current_size(); }
    bool is_open() const noexcept override { return impl_->is_open(); }

    std::shared_ptr<FakeFileSink> impl_;
};

} // namespace test_harness
