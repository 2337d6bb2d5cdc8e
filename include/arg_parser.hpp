/**
 * @file arg_parser.hpp
 * @brief Base argument parser for the braggsim command line tools.
 *
 * Provides the arguments shared by every tool (version, verbosity, the
 * input description file) and loads additional arguments from a
 * 'common.args' file in the working directory. Derived parsers add
 * tool-specific options and can hook into post_parse().
 */
#pragma once

#include <argparse/argparse.hpp>
#include <string>

/**
 * @brief Arguments common to all braggsim tools.
 */
struct BraggSimArguments {
    bool verbose = false;     ///< Enable debug logging
    std::string config_file;  ///< Simulation description (JSON)
};

/**
 * @brief Base argument parser for braggsim applications.
 *
 * Extends argparse::ArgumentParser with the common arguments and a
 * consistent error report. Parse errors print the usage and exit.
 */
class BraggSimArgumentParser : public argparse::ArgumentParser {
  public:
    explicit BraggSimArgumentParser(std::string version = "0.1.0");
    virtual ~BraggSimArgumentParser() = default;

    /**
     * @brief Add the positional input argument.
     *
     * Derived classes may override this to change how the input is
     * given, e.g. to make it optional.
     */
    virtual void add_input_arguments();

    auto parse_args(int argc, char **argv) -> BraggSimArguments;

  protected:
    /// Called after a successful parse. The base implementation applies verbosity.
    virtual void post_parse();

    BraggSimArguments _arguments{};
};
