#include "persist/gzip_stream.hpp"

#include <algorithm>
#include <array>
#include <limits>

namespace persist {
namespace {

constexpr int gzip_window_bits = 15 + 16;
constexpr std::size_t chunk_size = 16 * 1024;

Bytef* as_bytef(const std::byte* p) noexcept {
    return reinterpret_cast<Bytef*>(const_cast<std::byte*>(p));
}

} // namespace

GzipDeflater::~GzipDeflater() { end(); }

bool GzipDeflater::init(int level) noexcept {
    end();
    zs_ = z_stream{};
    last_error_ = deflateInit2(&zs_, level, Z_DEFLATED, gzip_window_bits, 8, Z_DEFAULT_STRATEGY);
    initialized_ = (last_error_ == Z_OK);
    return initialized_;
}

void GzipDeflater::end() noexcept {
    if (initialized_) {
        deflateEnd(&zs_);
        initialized_ = false;
    }
}

bool GzipDeflater::pump(const std::byte* data, std::size_t len, int flush, std::vector<std::byte>& out) {
    if (!initialized_) {
        last_error_ = Z_STREAM_ERROR;
        return false;
    }
    zs_.next_in = as_bytef(data);
    zs_.avail_in = static_cast<uInt>(len);
    std::array<std::byte, chunk_size> chunk{};
    while (true) {
        zs_.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs_.avail_out = static_cast<uInt>(chunk.size());
        const int rc = deflate(&zs_, flush);
        if (rc == Z_STREAM_ERROR) {
            last_error_ = rc;
            return false;
        }
        const std::size_t produced = chunk.size() - zs_.avail_out;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        if (flush == Z_FINISH) {
            if (rc == Z_STREAM_END) {
                break;
            }
            continue;
        }
        // Output space left over means deflate has nothing more to emit.
        if (zs_.avail_out != 0 && zs_.avail_in == 0) {
            break;
        }
    }
    last_error_ = Z_OK;
    return true;
}

bool GzipDeflater::write(std::span<const std::byte> in, std::vector<std::byte>& out) {
    if (in.size() > std::numeric_limits<uInt>::max()) {
        last_error_ = Z_BUF_ERROR;
        return false;
    }
    return pump(in.data(), in.size(), Z_NO_FLUSH, out);
}

bool GzipDeflater::sync_flush(std::vector<std::byte>& out) { return pump(nullptr, 0, Z_SYNC_FLUSH, out); }

bool GzipDeflater::finish(std::vector<std::byte>& out) {
    const bool ok = pump(nullptr, 0, Z_FINISH, out);
    end();
    return ok;
}

GunzipResult gunzip_tolerant(std::span<const std::byte> in, std::vector<std::byte>& out) {
    GunzipResult result;
    if (!has_gzip_magic(in)) {
        result.status = GunzipStatus::BadHeader;
        return result;
    }

    z_stream zs{};
    if (inflateInit2(&zs, gzip_window_bits) != Z_OK) {
        result.status = GunzipStatus::DataError;
        return result;
    }
    zs.next_in = as_bytef(in.data());
    zs.avail_in = static_cast<uInt>(std::min<std::size_t>(in.size(), std::numeric_limits<uInt>::max()));

    std::array<std::byte, chunk_size> chunk{};
    int rc = Z_OK;
    while (true) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        const std::size_t produced = chunk.size() - zs.avail_out;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        if (rc == Z_STREAM_END) {
            result.status = GunzipStatus::Complete;
            break;
        }
        if (rc == Z_BUF_ERROR || (rc == Z_OK && zs.avail_in == 0 && produced == 0)) {
            result.status = GunzipStatus::Truncated;
            break;
        }
        if (rc != Z_OK) {
            result.status = (out.empty() && zs.total_in < 10) ? GunzipStatus::BadHeader : GunzipStatus::DataError;
            break;
        }
    }
    result.consumed = static_cast<std::size_t>(zs.total_in);
    inflateEnd(&zs);
    return result;
}

} // namespace persist
