#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "core/error.hpp"
#include "core/player_config.hpp"

namespace persist {

// Reads a JSON player configuration. Keys absent from the document keep the
// defaults already present in `out`; unknown keys are skipped. On failure
// `out` is left untouched.
core::ErrorCode load_player_config(const std::filesystem::path& path,
                                   core::PlayerConfig& out,
                                   std::string& error) noexcept;

core::ErrorCode parse_player_config(std::string_view json,
                                    core::PlayerConfig& out,
                                    std::string& error) noexcept;

// Range checks that apply regardless of where the values came from
// (file, command line or operator commands).
core::ErrorCode validate_player_config(const core::PlayerConfig& cfg, std::string& error) noexcept;

} // namespace persist
