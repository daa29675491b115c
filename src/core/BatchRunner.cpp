#include "BatchRunner.h"
#include "FileSystemEntries.h"
#include "FormatSniffer.h"
#include <sstream>

namespace PixForge
{
    // --- ConversionOutcome ---

    ConversionOutcome ConversionOutcome::converted(const fs::path& source, const fs::path& outputPath)
    {
        ConversionOutcome outcome;
        outcome.status = Status::Converted;
        outcome.source = source;
        outcome.outputPath = outputPath;
        return outcome;
    }

    ConversionOutcome ConversionOutcome::skipped(const fs::path& source, const std::string& reason)
    {
        ConversionOutcome outcome;
        outcome.status = Status::Skipped;
        outcome.source = source;
        outcome.reason = reason;
        return outcome;
    }

    // --- ConversionStats ---

    void ConversionStats::record(const ConversionOutcome& outcome)
    {
        if (outcome.status == ConversionOutcome::Status::Converted)
        {
            incrementConverted();
        }
        else
        {
            incrementSkipped();
        }
    }

    std::string ConversionStats::summary() const
    {
        std::ostringstream out;
        if (isTotalFailure())
        {
            out << "No images were converted. All " << m_skipped << " files were skipped.";
        }
        else
        {
            out << "Batch conversion complete! Converted " << m_converted << " images, skipped " << m_skipped << ".";
        }
        return out.str();
    }

    void ConversionStats::printSummary() const
    {
        if (isTotalFailure())
        {
            std::cerr << "\n" << summary() << std::endl;
        }
        else
        {
            std::cout << "\n" << summary() << std::endl;
        }
    }

    // --- BatchRunner ---

    BatchRunner::BatchRunner(const ImageConverter& converter)
        : m_converter(converter)
    {
    }

    fs::path BatchRunner::mirroredOutputPath(const fs::path& file,
                                             const fs::path& inputDir,
                                             const fs::path& outputDir,
                                             const std::string& targetFormat)
    {
        fs::path relative = file.lexically_relative(inputDir);
        if (relative.empty())
        {
            relative = file.filename();
        }
        return outputDir / relative.parent_path() / FileSystemEntries::changeExtension(relative, to_lower(targetFormat));
    }

    ConversionOutcome BatchRunner::convertEntry(const fs::path& file,
                                                const fs::path& inputDir,
                                                const fs::path& outputDir,
                                                const std::string& targetFormat,
                                                int quality) const
    {
        if (!FormatSniffer::isImageFile(file))
        {
            return ConversionOutcome::skipped(file, errorKindName(ErrorKind::UnsupportedInputContent));
        }

        try
        {
            fs::path destination = mirroredOutputPath(file, inputDir, outputDir, targetFormat);
            FileSystemEntries::ensureDirectoryExists(destination);
            fs::path written = m_converter.convertOne(file, destination, targetFormat, quality);
            return ConversionOutcome::converted(file, written);
        }
        catch (const PixForgeException& e)
        {
            return ConversionOutcome::skipped(file, std::string(errorKindName(e.kind())) + ": " + e.detail());
        }
        catch (const std::exception& e)
        {
            return ConversionOutcome::skipped(file, e.what());
        }
    }

    ConversionStats BatchRunner::convertDirectory(const fs::path& inputDir,
                                                  const fs::path& outputDir,
                                                  const std::string& targetFormat,
                                                  int quality) const
    {
        FileSystemEntries::createDirectory(outputDir);

        std::cout << "Starting batch conversion of '" << inputDir.string() << "' to "
                  << to_upper(targetFormat) << "..." << std::endl;

        ConversionStats stats;
        for (const auto& file : FileSystemEntries::listFilesRecursive(inputDir))
        {
            ConversionOutcome outcome = convertEntry(file, inputDir, outputDir, targetFormat, quality);
            if (outcome.status == ConversionOutcome::Status::Converted)
            {
                std::cout << "Converted '" << outcome.source.string() << "' -> '" << outcome.outputPath.string() << "'." << std::endl;
            }
            else
            {
                std::cerr << "Warning: skipped '" << outcome.source.string() << "' (" << outcome.reason << ")." << std::endl;
            }
            stats.record(outcome);
        }

        stats.printSummary();
        return stats;
    }

} // namespace PixForge
