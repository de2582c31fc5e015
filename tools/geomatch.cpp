#include <geomatch/repl/repl.hpp>
#include <geomatch/session/session.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"geomatch - geocode address files and reconcile them by location"};

    geomatch::session::SessionConfig config;
    std::vector<std::string> files;
    std::string output_dir = ".";
    bool verbose = false;

    app.add_option("files", files, "Delimited address files (',' or '|')")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-k,--api-key", config.api_key, "Geocoding API key")
        ->envname("API_KEY")
        ->required();
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("--rate-limit", config.fetch.rate_limit, "Geocode requests per second")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--max-concurrency", config.fetch.max_concurrency,
                   "Geocode requests in flight at once")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--radius", config.merge.radius, "Initial match radius in miles")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--output-dir", output_dir, "Directory for *_coords.csv and matches.csv")
        ->capture_default_str()
        ->check(CLI::ExistingDirectory);
    app.add_option("--endpoint", config.endpoint, "Geocoding endpoint URL")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    config.output_dir = output_dir;
    geomatch::session::Session session(std::move(config));
    for (const auto& file : files) {
        if (auto added = session.add_file(file); !added) {
            spdlog::error("{}", added.error());
            return EXIT_FAILURE;
        }
    }

    geomatch::repl::ReplConfig repl_config;
    repl_config.verbose = verbose;
    geomatch::repl::run(repl_config, session);

    return EXIT_SUCCESS;
}
