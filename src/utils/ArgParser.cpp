#include "ArgParser.h"
#include <iostream>

using namespace std;

namespace PixForge
{

namespace def = Definitions;

// --- Helper Functions ---

// Function to check if a required argument is present
static bool checkRequired(const cxxopts::ParseResult& result, const std::string& name) {
    if (!result.count(name)) {
        cerr << "Argument error: " << name << " is required" << endl;
        return false;
    }
    return true;
}

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options(def::PROGRAM_NAME, "PixForge - convert images between PNG, JPEG, GIF, WEBP and ICO.")
{
    m_options.add_options()
        ("t,to", "Target format (png, jpeg, jpg, gif, webp, ico)", cxxopts::value<std::string>(), "FORMAT")
        ("o,output", "Output file or directory (default: next to the input; <input-parent>/" + def::DEFAULT_BATCH_OUTPUT_DIR + " for directories)",
            cxxopts::value<std::string>(), "OUTPUT")
        ("q,quality", "Image quality, 0-100", cxxopts::value<int>()->default_value(std::to_string(def::DEFAULT_QUALITY)), "QUALITY")
        ("v,verbose", "Print the conversion settings before starting", cxxopts::value<bool>()->default_value("false"))
        ("V,version", "Print the version and exit")
        ("h,help", "Display this help menu")
        ("input", "Image file or directory of images to convert", cxxopts::value<std::string>());

    m_options.parse_positional({"input"});
    m_options.positional_help("INPUT");
}

std::string ArgParser::help() const {
    return m_options.help();
}

cxxopts::ParseResult ArgParser::parseRaw(int argc, char** argv) {
    try {
        return m_options.parse(argc, argv);
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw std::runtime_error(std::string("Error parsing arguments: ") + e.what());
    }
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    auto result = parseRaw(argc, argv);

    if (result.count("help")) {
        std::cout << help() << std::endl;
        throw HelpDisplayed("Help displayed.");
    }

    if (result.count("version")) {
        std::cout << def::PROGRAM_NAME << " " << def::PROGRAM_VERSION << std::endl;
        throw HelpDisplayed("Version displayed.");
    }

    // --- Custom Requirement Checks ---
    if (!checkRequired(result, "to")) throw std::runtime_error("Missing required args.");
    if (!checkRequired(result, "input")) throw std::runtime_error("Missing required args.");

    return mapResults(result);
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result) {
    Arguments args;
    args.input = result["input"].as<std::string>();
    args.targetFormat = result["to"].as<std::string>();
    args.output = result.count("output") ? result["output"].as<std::string>() : "";
    args.quality = result["quality"].as<int>();
    args.verbose = result["verbose"].as<bool>();

    if (args.quality < def::MIN_QUALITY || args.quality > def::MAX_QUALITY) {
        cerr << "Argument error: quality must be between " << def::MIN_QUALITY << " and " << def::MAX_QUALITY
             << ", got " << args.quality << endl;
        throw std::runtime_error("Quality out of range.");
    }
    if (args.input.empty()) {
        cerr << "Argument error: input path is empty" << endl;
        throw std::runtime_error("Input path is empty.");
    }

    return args;
}

} // namespace PixForge
