#include <geomatch/repl/repl.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <span>
#include <string>

#ifdef GEOMATCH_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace geomatch::repl {

namespace {

#ifdef GEOMATCH_HAS_READLINE
constexpr std::array<std::string_view, 13> kCommands = {
    "list",      "config", "set",   "add",  "prefix", "method", "radius",
    "exclusive", "fetch",  "match", "help", "quit",   "exit",
};

auto command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kCommands.size()) {
        const auto command = kCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr) {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    std::fflush(stdout);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

/// Words from `first` onwards joined by single spaces, for column names
/// that contain spaces.
auto join_from(std::span<const std::string> words, std::size_t first) -> std::string {
    std::string out;
    for (std::size_t i = first; i < words.size(); ++i) {
        if (i > first) {
            out.push_back(' ');
        }
        out += words[i];
    }
    return out;
}

auto parse_index(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto report(const std::expected<void, std::string>& result) -> LineResult {
    if (!result) {
        fmt::print("error: {}\n", result.error());
        return LineResult::Error;
    }
    return LineResult::Ok;
}

auto usage(std::string_view text) -> LineResult {
    fmt::print("usage: {}\n", text);
    return LineResult::Error;
}

auto bad_index(std::string_view text) -> LineResult {
    fmt::print("error: '{}' is not a table index\n", text);
    return LineResult::Error;
}

auto list_columns(session::Session& session, std::span<const std::string> args) -> LineResult {
    if (args.size() != 2) {
        return usage("list <index>");
    }
    auto index = parse_index(args[1]);
    if (!index) {
        return bad_index(args[1]);
    }
    auto headers = session.columns(*index);
    if (!headers) {
        fmt::print("error: {}\n", headers.error());
        return LineResult::Error;
    }
    for (std::size_t c = 0; c < headers->size(); ++c) {
        fmt::print("  {:>3}  {}\n", c, (*headers)[c]);
    }
    return LineResult::Ok;
}

auto set_role(session::Session& session, std::span<const std::string> args) -> LineResult {
    if (args.size() < 4) {
        return usage("set <index> <id|addr1|addr2|city|state|zipcode|lat|lng> <column>");
    }
    auto index = parse_index(args[1]);
    if (!index) {
        return bad_index(args[1]);
    }
    return report(session.set_role(*index, args[2], join_from(args, 3)));
}

auto add_column(session::Session& session, std::span<const std::string> args) -> LineResult {
    if (args.size() < 4) {
        return usage("add <index> output|compare <column>");
    }
    auto index = parse_index(args[1]);
    if (!index) {
        return bad_index(args[1]);
    }
    session::ColumnKind kind{};
    if (args[2] == "output") {
        kind = session::ColumnKind::Output;
    } else if (args[2] == "compare") {
        kind = session::ColumnKind::Compare;
    } else {
        return usage("add <index> output|compare <column>");
    }
    return report(session.add_column(*index, kind, join_from(args, 3)));
}

auto set_prefix(session::Session& session, std::span<const std::string> args) -> LineResult {
    if (args.size() < 3) {
        return usage("prefix <index> <value>");
    }
    auto index = parse_index(args[1]);
    if (!index) {
        return bad_index(args[1]);
    }
    return report(session.set_prefix(*index, join_from(args, 2)));
}

auto run_fetch(session::Session& session) -> LineResult {
    auto summaries = session.fetch();
    if (!summaries) {
        fmt::print("error: {}\n", summaries.error());
        return LineResult::Error;
    }
    if (session.config().fetch.on_progress) {
        fmt::print("\n");
    }
    for (const auto& summary : *summaries) {
        fmt::print("{}: {} of {} rows resolved\n", summary.path.string(),
                   summary.report.resolved, summary.report.total);
    }
    return LineResult::Ok;
}

auto run_match(session::Session& session) -> LineResult {
    auto summary = session.match();
    if (!summary) {
        fmt::print("error: {}\n", summary.error());
        return LineResult::Error;
    }
    for (std::size_t i = 0; i < summary->folds.size(); ++i) {
        const auto& fold = summary->folds[i];
        fmt::print("  table {}: {} matched, {} appended, {} dropped\n", i, fold.matched,
                   fold.appended, fold.dropped);
    }
    fmt::print("wrote {} rows to {}\n", summary->rows, summary->path.string());
    return LineResult::Ok;
}

}  // namespace

auto split_words(std::string_view line) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < line.size()) {
        auto begin = line.find_first_not_of(" \t\r\n", pos);
        if (begin == std::string_view::npos) {
            break;
        }
        auto end = line.find_first_of(" \t\r\n", begin);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        words.emplace_back(line.substr(begin, end - begin));
        pos = end;
    }
    return words;
}

void print_help() {
    fmt::print(
        "commands:\n"
        "  list <index>                         show a table's columns\n"
        "  config                               show every table's settings\n"
        "  set <index> <role> <column>          bind id, addr1, addr2, city, state, zipcode,\n"
        "                                       or use a column as lat / lng\n"
        "  add <index> output|compare <column>  add an output or compare column\n"
        "  prefix <index> <value>               prefix a table's output headers\n"
        "  method left|inner|outer              set the join mode\n"
        "  radius <miles>                       set the match radius\n"
        "  exclusive true|false                 match each row at most once per table\n"
        "  fetch                                geocode every table\n"
        "  match                                merge every table into matches.csv\n"
        "  help                                 show this text\n"
        "  quit                                 leave\n");
}

auto execute_line(session::Session& session, std::string_view line) -> LineResult {
    const auto words = split_words(line);
    if (words.empty()) {
        return LineResult::Ok;
    }
    const std::span<const std::string> args(words);
    const auto& command = words.front();

    if (command == "quit" || command == "exit") {
        return LineResult::Quit;
    }
    if (command == "help") {
        print_help();
        return LineResult::Ok;
    }
    if (command == "list") {
        return list_columns(session, args);
    }
    if (command == "config") {
        fmt::print("{}", session.describe());
        return LineResult::Ok;
    }
    if (command == "set") {
        return set_role(session, args);
    }
    if (command == "add") {
        return add_column(session, args);
    }
    if (command == "prefix") {
        return set_prefix(session, args);
    }
    if (command == "method") {
        if (args.size() != 2) {
            return usage("method left|inner|outer");
        }
        return report(session.set_mode(args[1]));
    }
    if (command == "radius") {
        if (args.size() != 2) {
            return usage("radius <miles>");
        }
        return report(session.set_radius(args[1]));
    }
    if (command == "exclusive") {
        if (args.size() != 2) {
            return usage("exclusive true|false");
        }
        return report(session.set_exclusive(args[1]));
    }
    if (command == "fetch") {
        return run_fetch(session);
    }
    if (command == "match") {
        return run_match(session);
    }

    fmt::print("error: unknown command '{}'\n", command);
    print_help();
    return LineResult::Error;
}

void run(const ReplConfig& config, session::Session& session) {
    if (config.verbose) {
        spdlog::info("geomatch shell started (verbose={})", config.verbose);
    }
    if (config.show_progress) {
        session.on_fetch_progress([](std::size_t done, std::size_t total) {
            fmt::print("\rfetched {}/{}", done, total);
            std::fflush(stdout);
        });
    }

    for (std::size_t i = 0; i < session.size(); ++i) {
        const auto& table = session.tables()[i];
        fmt::print("[{}] {} ({} rows)\n", i, table.source_path(), table.rows());
    }
    fmt::print("type 'help' for commands\n");

    configure_line_editing();

    std::string line;
    while (true) {
        if (!read_repl_line(config.prompt, line)) {
            fmt::print("\n");
            break;
        }
        if (execute_line(session, line) == LineResult::Quit) {
            break;
        }
    }

    spdlog::info("geomatch shell exiting");
}

}  // namespace geomatch::repl
