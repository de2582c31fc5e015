#pragma once

#include <geomatch/session/session.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace geomatch::repl {

/// Configuration for the command shell.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = "geomatch> ";
    /// Print fetch progress while geocoding.
    bool show_progress = true;
};

enum class LineResult : std::uint8_t {
    Ok,
    Error,
    Quit,
};

/// Run the interactive loop until quit or end of input.
void run(const ReplConfig& config, session::Session& session);

/// Execute one command line against `session`, printing its output.
[[nodiscard]] auto execute_line(session::Session& session, std::string_view line) -> LineResult;

/// Split on whitespace, dropping empty words.
[[nodiscard]] auto split_words(std::string_view line) -> std::vector<std::string>;

void print_help();

}  // namespace geomatch::repl
