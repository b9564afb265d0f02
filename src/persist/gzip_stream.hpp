#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <zlib.h>

namespace persist {

// Streaming gzip compressor. Output accumulates in a caller-owned buffer so
// the writer decides when bytes reach the sink.
class GzipDeflater {
public:
    GzipDeflater() = default;
    ~GzipDeflater();

    GzipDeflater(const GzipDeflater&) = delete;
    GzipDeflater& operator=(const GzipDeflater&) = delete;

    bool init(int level = Z_DEFAULT_COMPRESSION) noexcept;
    bool initialized() const noexcept { return initialized_; }

    // Buffers input; output is produced as zlib sees fit.
    bool write(std::span<const std::byte> in, std::vector<std::byte>& out);

    // Z_SYNC_FLUSH: everything written so far becomes decodable from out.
    bool sync_flush(std::vector<std::byte>& out);

    // Writes the gzip trailer. The deflater is unusable afterwards.
    bool finish(std::vector<std::byte>& out);

    int last_error() const noexcept { return last_error_; }

private:
    bool pump(const std::byte* data, std::size_t len, int flush, std::vector<std::byte>& out);
    void end() noexcept;

    z_stream zs_{};
    bool initialized_{false};
    int last_error_{Z_OK};
};

enum class GunzipStatus {
    Complete,   // trailer seen and verified
    Truncated,  // input ended before the trailer; output holds what decoded
    BadHeader,  // not a gzip stream
    DataError,  // corrupt deflate data after some output
};

struct GunzipResult {
    GunzipStatus status{GunzipStatus::Complete};
    std::size_t consumed{0};
};

inline bool has_gzip_magic(std::span<const std::byte> data) noexcept {
    return data.size() >= 2 && data[0] == std::byte{0x1f} && data[1] == std::byte{0x8b};
}

// Inflates a whole gzip buffer, keeping every byte decoded before the point
// where the stream ends or breaks.
GunzipResult gunzip_tolerant(std::span<const std::byte> in, std::vector<std::byte>& out);

} // namespace persist
