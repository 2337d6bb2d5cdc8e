/**
 * @file arg_parser.cc
 * @brief Implementation of the base argument parser.
 *
 * Additional arguments are read from a 'common.args' file in the
 * working directory, one per line, unless already given. Errors are
 * reported with the usage text and end the program.
 */
#include "arg_parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include "braggsim_logger.hpp"
#include "common.hpp"

BraggSimArgumentParser::BraggSimArgumentParser(std::string version)
    : ArgumentParser("braggsim", version, argparse::default_arguments::help) {
    add_argument("--version")
      .help("Print version information and exit")
      .action([=](const auto &) {
          fmt::print("{}\n", version);
          std::exit(0);
      })
      .default_value(false)
      .implicit_value(true)
      .nargs(0);

    add_argument("-v", "--verbose")
      .help("Verbose output")
      .implicit_value(false)
      .action([&](const std::string &) { _arguments.verbose = true; });
}

void BraggSimArgumentParser::add_input_arguments() {
    add_argument("config")
      .metavar("CONFIG.json")
      .help("Simulation description: beam, detector, crystal and sampling")
      .action([&](const std::string &val) { _arguments.config_file = val; });
}

auto BraggSimArgumentParser::parse_args(int argc, char **argv) -> BraggSimArguments {
    std::vector<std::string> args{argv, argv + argc};

    std::filesystem::path argfile{"common.args"};
    if (std::filesystem::exists(argfile)) {
        std::ifstream f(argfile);
        std::string arg;
        while (std::getline(f, arg)) {
            if (!arg.empty() && std::find(args.begin(), args.end(), arg) == args.end()) {
                args.push_back(arg);
            }
        }
    }

    try {
        ArgumentParser::parse_args(args);
    } catch (const std::runtime_error &e) {
        fmt::print("{}: {}\n{}\n", bold(red("Error")), red(e.what()), usage());
        std::exit(1);
    }

    post_parse();

    return _arguments;
}

void BraggSimArgumentParser::post_parse() {
    if (_arguments.verbose) {
        BraggSimLogger::setLevel(spdlog::level::debug);
    }
}
