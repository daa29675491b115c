#pragma once
#include "Common.h"
#include "FormatConverter.h"

namespace PixForge
{
    /**
     * @brief Result of handling one file in a batch.
     */
    struct ConversionOutcome
    {
        enum class Status
        {
            Converted,
            Skipped
        };

        Status status = Status::Skipped;
        fs::path source;
        fs::path outputPath; ///< Set when converted
        std::string reason;  ///< Set when skipped

        static ConversionOutcome converted(const fs::path& source, const fs::path& outputPath);
        static ConversionOutcome skipped(const fs::path& source, const std::string& reason);
    };

    /**
     * @brief Converted/skipped tallies of one batch run.
     */
    class ConversionStats
    {
    public:
        void record(const ConversionOutcome& outcome);

        void incrementConverted() { ++m_converted; }
        void incrementSkipped() { ++m_skipped; }

        int converted() const { return m_converted; }
        int skipped() const { return m_skipped; }

        /**
         * @brief True when files were seen but none converted. Not an error.
         */
        bool isTotalFailure() const { return m_converted == 0 && m_skipped > 0; }

        std::string summary() const;
        void printSummary() const;

    private:
        int m_converted = 0;
        int m_skipped = 0;
    };

    /**
     * @brief Converts every image below a directory, mirroring the tree under
     * the output directory. A failing file is counted as skipped and the run
     * carries on.
     */
    class BatchRunner
    {
    public:
        explicit BatchRunner(const ImageConverter& converter);

        /**
         * @brief Walks inputDir recursively (sorted by path) and converts every
         * eligible file. Files failing the eligibility gate are counted as
         * skipped without being decoded.
         * @throws PixForgeException (DirectoryCreationFailed) only if outputDir
         * itself cannot be created.
         */
        ConversionStats convertDirectory(const fs::path& inputDir,
                                         const fs::path& outputDir,
                                         const std::string& targetFormat,
                                         int quality) const;

        /**
         * @brief Handles a single file of a batch; never throws.
         */
        ConversionOutcome convertEntry(const fs::path& file,
                                       const fs::path& inputDir,
                                       const fs::path& outputDir,
                                       const std::string& targetFormat,
                                       int quality) const;

        /**
         * @brief outputDir/<path of file relative to inputDir, extension replaced>.
         */
        static fs::path mirroredOutputPath(const fs::path& file,
                                           const fs::path& inputDir,
                                           const fs::path& outputDir,
                                           const std::string& targetFormat);

    private:
        const ImageConverter& m_converter;
    };

} // namespace PixForge
