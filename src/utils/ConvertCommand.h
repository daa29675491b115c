#pragma once
#include "../core/Common.h"
#include "ArgParser.h"

namespace PixForge
{
    /**
     * @brief Top-level flow of the pixforge executable: validate, pick the
     * mode, run it.
     */
    class ConvertCommand
    {
    public:
        /**
         * @throws PixForgeException (InputNotFound)
         */
        static void validateInputPath(const fs::path& input);

        /**
         * @brief Checks a --to value against the allowlist, case-insensitively.
         * @return The lower-cased format name.
         * @throws PixForgeException (UnsupportedTargetFormat)
         */
        static std::string validateTargetFormat(const std::string& format);

        /**
         * @brief Output location when -o is not given: the input's directory for
         * a file, <input-parent>/pixforge_output for a directory.
         */
        static fs::path defaultOutputPath(const fs::path& input);

        static void printConversionInfo(const fs::path& input, const fs::path& output,
                                        const std::string& format, int quality);

        /**
         * @brief Runs a conversion for parsed arguments.
         *
         * Validation errors and a failing single-file conversion propagate as
         * PixForgeException; batch runs report skips and return normally.
         * @return Process exit code.
         */
        static int run(const ArgParser::Arguments& args);
    };

} // namespace PixForge
