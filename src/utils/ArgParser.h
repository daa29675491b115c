#ifndef PIXFORGE_ARG_PARSER_H
#define PIXFORGE_ARG_PARSER_H

#include <string>
#include <stdexcept>
#include "cxxopts.hpp" // Requires cxxopts dependency
#include "Definitions.h"

namespace PixForge
{

/**
 * @brief Utility class to parse the pixforge command line using cxxopts.
 *
 * Usage: pixforge --to FORMAT [-o OUTPUT] [-q QUALITY] [-v] INPUT
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::string input;
        std::string output;        ///< Empty when -o was not given
        std::string targetFormat;  ///< As typed; validated by the caller
        int quality = Definitions::DEFAULT_QUALITY;
        bool verbose = false;
    };

    /**
     * @brief Thrown after --help or --version text was printed.
     */
    class HelpDisplayed : public std::runtime_error {
    public:
        explicit HelpDisplayed(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Registers all options.
     */
    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed values.
     * @throws HelpDisplayed for -h / -V, std::runtime_error for invalid input.
     */
    Arguments parseArgs(int argc, char** argv);

    /**
     * @brief Full usage text.
     */
    std::string help() const;

private:
    cxxopts::Options m_options;

    /**
     * @brief Runs cxxopts, turning its exceptions into std::runtime_error.
     */
    cxxopts::ParseResult parseRaw(int argc, char** argv);

    /**
     * @brief Extracts and validates results from cxxopts::ParseResult.
     */
    Arguments mapResults(const cxxopts::ParseResult& result);
};

} // namespace PixForge

#endif // PIXFORGE_ARG_PARSER_H
