#include "ConvertCommand.h"
#include "Definitions.h"
#include "../core/FormatConverter.h"
#include "../core/BatchRunner.h"

namespace PixForge
{
    void ConvertCommand::validateInputPath(const fs::path& input)
    {
        std::error_code ec;
        if (!fs::exists(input, ec))
        {
            throw PixForgeException(ErrorKind::InputNotFound, "Input path does not exist: " + input.string());
        }
    }

    std::string ConvertCommand::validateTargetFormat(const std::string& format)
    {
        std::string lowered = to_lower(format);
        const auto& supported = Definitions::SUPPORTED_TARGET_FORMATS;
        if (std::find(supported.begin(), supported.end(), lowered) == supported.end())
        {
            std::string list;
            for (const auto& f : supported)
            {
                list += (list.empty() ? "" : ", ") + f;
            }
            throw PixForgeException(ErrorKind::UnsupportedTargetFormat,
                "Unsupported target format: " + format + " (supported: " + list + ")");
        }
        return lowered;
    }

    fs::path ConvertCommand::defaultOutputPath(const fs::path& input)
    {
        fs::path normalized = fs::absolute(input).lexically_normal();
        if (!normalized.has_filename())
        {
            normalized = normalized.parent_path(); // "dir/" -> "dir"
        }

        std::error_code ec;
        if (fs::is_regular_file(normalized, ec))
        {
            return normalized.parent_path();
        }
        return normalized.parent_path() / Definitions::DEFAULT_BATCH_OUTPUT_DIR;
    }

    void ConvertCommand::printConversionInfo(const fs::path& input, const fs::path& output,
                                             const std::string& format, int quality)
    {
        std::cout << "Conversion settings:" << std::endl;
        std::cout << "   Input:   " << input.string() << std::endl;
        std::cout << "   Output:  " << output.string() << std::endl;
        std::cout << "   Format:  " << to_upper(format) << std::endl;
        std::cout << "   Quality: " << quality << "%" << std::endl;
        std::cout << std::endl;
    }

    int ConvertCommand::run(const ArgParser::Arguments& args)
    {
        fs::path input(args.input);
        validateInputPath(input);
        std::string format = validateTargetFormat(args.targetFormat);

        fs::path output = args.output.empty() ? defaultOutputPath(input) : fs::path(args.output);

        if (args.verbose)
        {
            printConversionInfo(input, output, format, args.quality);
        }

        ImageConverter converter;

        std::error_code ec;
        if (fs::is_regular_file(input, ec))
        {
            std::cout << "Single file mode" << std::endl;
            fs::path written = converter.convertOne(input, output, format, args.quality);
            std::cout << "Converted '" << input.string() << "' -> '" << written.string() << "'." << std::endl;
        }
        else
        {
            std::cout << "Batch mode" << std::endl;
            BatchRunner runner(converter);
            runner.convertDirectory(input, output, format, args.quality);
        }
        return 0;
    }

} // namespace PixForge
