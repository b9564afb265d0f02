#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "api/controller.hpp"

namespace api {

// Line-oriented operator console over a Controller.
class CommandShell {
public:
    CommandShell(Controller& controller, std::istream& in, std::ostream& out) noexcept
        : controller_(controller), in_(in), out_(out) {}

    // Prompts and executes commands until `quit` or end of input.
    void run();

    // Executes one line. Returns false when the shell should exit.
    bool execute(std::string_view line);

    static constexpr std::string_view prompt = "[dmxrec]> ";

private:
    void print_help();
    void print_status();
    void print_recordings(const std::vector<std::filesystem::path>& files);
    void report(const char* action, core::ErrorCode rc, const std::string& error);

    Controller& controller_;
    std::istream& in_;
    std::ostream& out_;
};

std::vector<std::string> split_words(std::string_view line);

} // namespace api
