#pragma once
#include "Common.h"
#include "ImageCodec.h"

namespace PixForge
{
    /**
     * @brief Converts one image file: sniff, decode, classify, encode, write.
     */
    class ImageConverter
    {
    public:
        explicit ImageConverter(std::shared_ptr<ImageCodec> codec = makeDefaultCodec());

        /**
         * @brief Converts a single image file to the target format.
         *
         * Nothing is printed on success; the caller reports. The output file is
         * only created once the encoded bytes are complete in memory.
         *
         * @param inputPath The image to convert.
         * @param outputPath An existing directory (the file name is derived from
         * the input) or the literal destination file.
         * @param targetFormat One of png, jpeg, jpg, gif, webp, ico (any case).
         * @param quality 0-100.
         * @return The path that was written.
         * @throws PixForgeException carrying the failing stage and the input path.
         */
        fs::path convertOne(const fs::path& inputPath,
                            const fs::path& outputPath,
                            const std::string& targetFormat,
                            int quality) const;

        /**
         * @brief Destination file for an input: output/<stem>.<format> when output
         * is a directory, otherwise output itself.
         */
        static fs::path resolveOutputPath(const fs::path& inputPath,
                                          const fs::path& outputPath,
                                          const std::string& targetFormat);

    private:
        std::shared_ptr<ImageCodec> m_codec;
    };

} // namespace PixForge
