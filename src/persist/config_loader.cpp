#include "persist/config_loader.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <optional>
#include <vector>

namespace persist {
namespace {

constexpr int max_nesting = 32;

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool expect(char c) noexcept { return consume(c); }

    char peek() const noexcept {
        skip_ws();
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    std::optional<std::string> parse_string(std::string& err) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c == '\\') {
                if (pos_ >= src_.size()) {
                    err = "Invalid escape";
                    return std::nullopt;
                }
                const char esc = src_[pos_++];
                switch (esc) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    default:
                        err = "Unsupported escape sequence";
                        return std::nullopt;
                }
            } else {
                out.push_back(c);
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    std::optional<std::int64_t> parse_int64(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        if (pos_ < src_.size() && src_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (pos_ == start || (pos_ == start + 1 && src_[start] == '-')) {
            err = "Expected integer";
            return std::nullopt;
        }
        if (pos_ < src_.size() && (src_[pos_] == '.' || src_[pos_] == 'e' || src_[pos_] == 'E')) {
            err = "Expected integer, got fraction";
            return std::nullopt;
        }
        std::int64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (conv.ec != std::errc()) {
            err = "Invalid integer";
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(std::string& err) noexcept {
        skip_ws();
        if (src_.substr(pos_).starts_with("true")) {
            pos_ += 4;
            return true;
        }
        if (src_.substr(pos_).starts_with("false")) {
            pos_ += 5;
            return false;
        }
        err = "Expected boolean";
        return std::nullopt;
    }

    // Skips one value of any type.
    bool skip_value(std::string& err, int depth = 0) noexcept {
        if (depth > max_nesting) {
            err = "Nesting too deep";
            return false;
        }
        const char c = peek();
        if (c == '"') {
            return parse_string(err).has_value();
        }
        if (c == '{' || c == '[') {
            const char close = c == '{' ? '}' : ']';
            ++pos_;
            if (consume(close)) {
                return true;
            }
            while (true) {
                if (c == '{') {
                    if (!parse_string(err)) return false;
                    if (!expect(':')) { err = "Expected ':'"; return false; }
                }
                if (!skip_value(err, depth + 1)) return false;
                if (consume(close)) return true;
                if (!consume(',')) { err = "Expected ','"; return false; }
            }
        }
        if (src_.substr(pos_).starts_with("null")) {
            pos_ += 4;
            return true;
        }
        if (c == 't' || c == 'f') {
            return parse_bool(err).has_value();
        }
        const std::size_t start = pos_;
        while (pos_ < src_.size()) {
            const char d = src_[pos_];
            if (std::isdigit(static_cast<unsigned char>(d)) || d == '-' || d == '+' ||
                d == '.' || d == 'e' || d == 'E') {
                ++pos_;
            } else {
                break;
            }
        }
        if (pos_ == start) {
            err = "Unexpected character";
            return false;
        }
        return true;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

    std::size_t offset() const noexcept { return pos_; }

private:
    mutable std::size_t pos_{0};
    std::string_view src_;
};

bool parse_uint_in(JsonCursor& cur, std::int64_t lo, std::int64_t hi,
                   std::int64_t& out, std::string& err) noexcept {
    auto v = cur.parse_int64(err);
    if (!v) {
        return false;
    }
    if (*v < lo || *v > hi) {
        err = "Value " + std::to_string(*v) + " out of range [" + std::to_string(lo) + ", " +
              std::to_string(hi) + "]";
        return false;
    }
    out = *v;
    return true;
}

bool parse_universe_array(JsonCursor& cur, std::vector<std::uint32_t>& out, std::string& err) noexcept {
    if (!cur.expect('[')) { err = "Expected universe array"; return false; }
    std::vector<std::uint32_t> list;
    while (true) {
        if (cur.consume(']')) break;
        std::int64_t u = 0;
        if (!parse_uint_in(cur, 0, std::numeric_limits<std::uint32_t>::max(), u, err)) return false;
        list.push_back(static_cast<std::uint32_t>(u));
        if (cur.consume(']')) break;
        if (!cur.consume(',')) { err = "Expected ','"; return false; }
    }
    out = std::move(list);
    return true;
}

bool parse_outputs_array(JsonCursor& cur, std::vector<core::OutputConfig>& out, std::string& err) noexcept {
    if (!cur.expect('[')) { err = "Expected outputs array"; return false; }
    std::vector<core::OutputConfig> outputs;
    while (true) {
        if (cur.consume(']')) break;
        if (!cur.expect('{')) { err = "Expected output object"; return false; }
        core::OutputConfig oc;
        bool have_endpoint = false;
        while (true) {
            if (cur.consume('}')) break;
            auto key = cur.parse_string(err);
            if (!key) return false;
            if (!cur.expect(':')) { err = "Expected ':'"; return false; }
            if (*key == "endpoint") {
                auto v = cur.parse_string(err);
                if (!v) return false;
                oc.endpoint = std::move(*v);
                have_endpoint = true;
            } else if (*key == "universes") {
                if (!parse_universe_array(cur, oc.universes, err)) return false;
            } else if (!cur.skip_value(err)) {
                return false;
            }
            if (cur.consume('}')) break;
            if (!cur.consume(',')) { err = "Expected ','"; return false; }
        }
        if (!have_endpoint) { err = "Output missing endpoint"; return false; }
        outputs.push_back(std::move(oc));
        if (cur.consume(']')) break;
        if (!cur.consume(',')) { err = "Expected ','"; return false; }
    }
    out = std::move(outputs);
    return true;
}

bool parse_field(JsonCursor& cur, const std::string& key, core::PlayerConfig& cfg, std::string& err) noexcept {
    std::int64_t n = 0;
    if (key == "short_name" || key == "long_name" || key == "input_channel" ||
        key == "recordings_dir") {
        auto v = cur.parse_string(err);
        if (!v) return false;
        if (key == "short_name") cfg.short_name = std::move(*v);
        else if (key == "long_name") cfg.long_name = std::move(*v);
        else if (key == "input_channel") cfg.input_channel = std::move(*v);
        else cfg.recordings_dir = std::move(*v);
        return true;
    }
    if (key == "universes") {
        return parse_universe_array(cur, cfg.universes, err);
    }
    if (key == "outputs") {
        return parse_outputs_array(cur, cfg.outputs, err);
    }
    if (key == "stream_id") {
        if (!parse_uint_in(cur, std::numeric_limits<std::int32_t>::min(),
                           std::numeric_limits<std::int32_t>::max(), n, err)) return false;
        cfg.stream_id = static_cast<std::int32_t>(n);
        return true;
    }
    if (key == "fps") {
        if (!parse_uint_in(cur, core::min_fps, core::max_fps, n, err)) return false;
        cfg.fps = static_cast<std::uint32_t>(n);
        return true;
    }
    if (key == "passthrough") {
        auto v = cur.parse_bool(err);
        if (!v) return false;
        cfg.passthrough = *v;
        return true;
    }
    if (key == "idle_timeout_ms") {
        if (!parse_uint_in(cur, 0, 24LL * 3600 * 1000, n, err)) return false;
        cfg.idle_timeout = std::chrono::milliseconds(n);
        return true;
    }
    if (key == "fade_window_frames") {
        if (!parse_uint_in(cur, 0, 1'000'000, n, err)) return false;
        cfg.fade_window_frames = static_cast<std::uint32_t>(n);
        return true;
    }
    if (key == "timing") {
        auto v = cur.parse_string(err);
        if (!v) return false;
        if (*v == "recorded") {
            cfg.timing = core::TimingMode::Recorded;
        } else if (*v == "fixed") {
            cfg.timing = core::TimingMode::Fixed;
        } else {
            err = "Unknown timing mode: " + *v;
            return false;
        }
        return true;
    }
    return cur.skip_value(err);
}

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!out.empty() && !in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace

core::ErrorCode parse_player_config(std::string_view json,
                                    core::PlayerConfig& out,
                                    std::string& error) noexcept {
    JsonCursor cur(json);
    if (!cur.expect('{')) {
        error = "Expected object";
        return core::ErrorCode::InvalidFormat;
    }
    core::PlayerConfig cfg = out;
    while (true) {
        if (cur.consume('}')) break;
        std::string err;
        auto key = cur.parse_string(err);
        if (!key) { error = err; return core::ErrorCode::InvalidFormat; }
        if (!cur.expect(':')) { error = "Expected ':'"; return core::ErrorCode::InvalidFormat; }
        if (!parse_field(cur, *key, cfg, err)) {
            error = *key + ": " + err;
            return core::ErrorCode::InvalidFormat;
        }
        if (cur.consume('}')) break;
        if (!cur.consume(',')) {
            error = "Expected ',' at offset " + std::to_string(cur.offset());
            return core::ErrorCode::InvalidFormat;
        }
    }
    if (!cur.eof()) {
        error = "Trailing content after object";
        return core::ErrorCode::InvalidFormat;
    }
    out = std::move(cfg);
    return core::ErrorCode::Ok;
}

core::ErrorCode load_player_config(const std::filesystem::path& path,
                                   core::PlayerConfig& out,
                                   std::string& error) noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "Config file not found: " + path.string();
        return core::ErrorCode::NotFound;
    }
    std::string contents;
    if (!load_file(path, contents, error)) {
        return core::ErrorCode::IoError;
    }
    const auto rc = parse_player_config(contents, out, error);
    if (rc != core::ErrorCode::Ok) {
        error = path.string() + ": " + error;
    }
    return rc;
}

core::ErrorCode validate_player_config(const core::PlayerConfig& cfg, std::string& error) noexcept {
    if (cfg.fps < core::min_fps || cfg.fps > core::max_fps) {
        error = "fps must be between " + std::to_string(core::min_fps) + " and " +
                std::to_string(core::max_fps);
        return core::ErrorCode::InvalidArgument;
    }
    for (const auto u : cfg.universes) {
        if (u > core::max_logical_universe) {
            error = "universe " + std::to_string(u) + " exceeds " +
                    std::to_string(core::max_logical_universe);
            return core::ErrorCode::InvalidArgument;
        }
    }
    for (const auto& o : cfg.outputs) {
        if (o.endpoint.empty()) {
            error = "output endpoint must not be empty";
            return core::ErrorCode::InvalidArgument;
        }
        for (const auto u : o.universes) {
            if (u > core::max_logical_universe) {
                error = "output " + o.endpoint + ": universe " + std::to_string(u) + " exceeds " +
                        std::to_string(core::max_logical_universe);
                return core::ErrorCode::InvalidArgument;
            }
        }
    }
    if (cfg.recordings_dir.empty()) {
        error = "recordings_dir must not be empty";
        return core::ErrorCode::InvalidArgument;
    }
    return core::ErrorCode::Ok;
}

} // namespace persist
