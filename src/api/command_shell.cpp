#include "api/command_shell.hpp"

#include <charconv>
#include <istream>
#include <ostream>

namespace api {
namespace {

struct CommandHelp {
    const char* name;
    const char* args;
    const char* description;
};

constexpr CommandHelp command_table[] = {
    {"help", "", "Show this help."},
    {"config", "", "Show the player configuration."},
    {"status", "", "Show recording, playback and output counters."},
    {"record", "", "Start recording inbound universes."},
    {"stop", "", "Stop recording and save the file."},
    {"play", "<file>", "Play a recording in a loop."},
    {"end", "", "Stop playback."},
    {"highlight", "<universe...>", "Blink the outputs of the given universes."},
    {"passthrough", "", "Toggle forwarding of inbound universes to the outputs."},
    {"fps", "<1-100>", "Set the playback rate."},
    {"bk", "", "Send a blackout to every output."},
    {"list", "", "List available recordings."},
    {"quit", "", "Exit."},
};

bool parse_u32(const std::string& s, std::uint32_t& out) {
    const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

} // namespace

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) {
            ++i;
        }
        const std::size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r') {
            ++i;
        }
        if (i > start) {
            words.emplace_back(line.substr(start, i - start));
        }
    }
    return words;
}

void CommandShell::run() {
    std::string line;
    while (true) {
        out_ << prompt << std::flush;
        if (!std::getline(in_, line)) {
            out_ << "\n";
            return;
        }
        if (!execute(line)) {
            return;
        }
    }
}

bool CommandShell::execute(std::string_view line) {
    const auto words = split_words(line);
    if (words.empty()) {
        return true;
    }
    const std::string& cmd = words[0];
    std::string error;

    if (cmd == "help") {
        print_help();
    } else if (cmd == "config") {
        out_ << controller_.describe_config();
    } else if (cmd == "status") {
        print_status();
    } else if (cmd == "record") {
        const auto rc = controller_.start_recording(error);
        if (rc == core::ErrorCode::Ok) {
            out_ << "Recording to " << controller_.status().recording_path.string() << "\n";
        } else {
            report("record", rc, error);
        }
    } else if (cmd == "stop") {
        const auto path = controller_.status().recording_path;
        const auto rc = controller_.stop_recording(error);
        if (rc == core::ErrorCode::Ok) {
            out_ << "Saved to " << path.string() << "\n";
        } else {
            report("stop", rc, error);
        }
    } else if (cmd == "play") {
        std::vector<std::filesystem::path> available;
        const std::string name = words.size() > 1 ? words[1] : std::string{};
        const auto rc = controller_.play(name, error, &available);
        if (rc == core::ErrorCode::Ok) {
            out_ << "Playing " << name << "\n";
        } else {
            report("play", rc, error);
            print_recordings(available);
        }
    } else if (cmd == "end") {
        const auto rc = controller_.stop_playback(error);
        if (rc == core::ErrorCode::Ok) {
            out_ << "Playback stopped\n";
        } else {
            report("end", rc, error);
        }
    } else if (cmd == "highlight") {
        std::vector<std::uint32_t> universes;
        for (std::size_t i = 1; i < words.size(); ++i) {
            std::uint32_t u = 0;
            if (!parse_u32(words[i], u)) {
                out_ << "Invalid universe: " << words[i] << "\n";
                return true;
            }
            universes.push_back(u);
        }
        const auto rc = controller_.highlight(universes, error);
        if (rc != core::ErrorCode::Ok) {
            report("highlight", rc, error);
        }
    } else if (cmd == "passthrough") {
        out_ << "Passthrough " << (controller_.toggle_passthrough() ? "enabled" : "disabled") << "\n";
    } else if (cmd == "fps") {
        std::uint32_t fps = 0;
        if (words.size() < 2 || !parse_u32(words[1], fps)) {
            out_ << "Usage: fps <1-100>\n";
            return true;
        }
        const auto rc = controller_.set_fps(fps, error);
        if (rc == core::ErrorCode::Ok) {
            out_ << "FPS set to " << fps << "\n";
        } else {
            report("fps", rc, error);
        }
    } else if (cmd == "bk") {
        const auto res = controller_.blackout();
        out_ << "Blackout sent to " << (res.matched - res.failed) << " of " << res.matched << " outputs\n";
    } else if (cmd == "list") {
        print_recordings(controller_.list_recordings());
    } else if (cmd == "quit" || cmd == "exit") {
        return false;
    } else {
        out_ << "Command not found: " << cmd << "\n";
    }
    return true;
}

void CommandShell::print_help() {
    out_ << "Commands:\n";
    for (const auto& c : command_table) {
        std::string usage = c.name;
        if (*c.args != '\0') {
            usage += " ";
            usage += c.args;
        }
        out_ << "  " << usage;
        for (std::size_t pad = usage.size(); pad < 26; ++pad) {
            out_ << ' ';
        }
        out_ << c.description << "\n";
    }
}

void CommandShell::print_status() {
    const auto s = controller_.status();
    out_ << "recording:   " << (s.recording ? s.recording_path.string() : std::string("no")) << "\n";
    out_ << "playing:     "
         << (s.playing ? s.playing_path.filename().string() + " (" + std::to_string(s.playing_frames) + " frames)"
                       : std::string("no"))
         << "\n";
    out_ << "passthrough: " << (s.passthrough ? "on" : "off") << "\n";
    out_ << "fps:         " << s.fps << "\n";
    out_ << "outputs:     " << s.outputs << " (" << s.output_stats.sends << " sent, " << s.output_stats.failures
         << " failed)\n";
    out_ << "recorder:    " << s.recorder.written << " written, " << s.recorder.dropped() << " dropped\n";
    out_ << "playback:    " << s.scheduler.frames_sent << " frames, " << s.scheduler.loops << " loops, "
         << s.scheduler.late_frames << " late\n";
}

void CommandShell::print_recordings(const std::vector<std::filesystem::path>& files) {
    out_ << "Available files:\n";
    if (files.empty()) {
        out_ << "\t(none)\n";
    }
    for (const auto& f : files) {
        out_ << "\t- " << f.filename().string() << "\n";
    }
}

void CommandShell::report(const char* action, core::ErrorCode rc, const std::string& error) {
    out_ << action << " failed: " << error << " (" << core::to_string(rc) << ")\n";
}

} // namespace api
