#include "core/Common.h"
#include "utils/ArgParser.h"
#include "utils/ConvertCommand.h"

using namespace PixForge;

int main(int argc, char** argv)
{
    ArgParser::Arguments args;
    try {
        ArgParser parser;
        args = parser.parseArgs(argc, argv);
    } catch (const ArgParser::HelpDisplayed&) {
        return 0;
    } catch (const std::exception&) {
        // ArgParser already reported the problem
        return 2;
    }

    try {
        return ConvertCommand::run(args);
    } catch (const PixForgeException& e) {
        std::cerr << "ERROR: " << e.detail() << " [" << errorKindName(e.kind()) << "]" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
