#pragma once
#include "Common.h"
#include <cstdint>

namespace PixForge
{
    /**
     * @brief Reads and writes the Windows ICO container.
     *
     * PNG payloads and the color planes of paletted or 24-bit bitmaps are
     * decoded by OpenCV. The directory, 32-bit bitmaps and the AND
     * transparency mask are handled here.
     */
    class IcoContainer
    {
    public:
        /**
         * @brief Builds a single-image ICO file around an encoded PNG.
         * @param png Complete PNG file bytes.
         * @param width Image width, 1-256.
         * @param height Image height, 1-256.
         * @throws PixForgeException (EncodeFailed) if the size cannot be stored.
         */
        static std::vector<unsigned char> wrapPng(const std::vector<unsigned char>& png, int width, int height);

        /**
         * @brief Raw payload of the largest image of an ICO file: a complete
         * PNG stream or a headerless DIB (BITMAPINFOHEADER, pixels, AND mask).
         * @throws PixForgeException (DecodeFailed) on a malformed directory.
         */
        static std::vector<unsigned char> largestEntryPayload(const std::vector<unsigned char>& ico);

        /**
         * @brief Decodes the largest image of an ICO file.
         *
         * DIB entries come back as BGRA. 32-bit entries carry their own alpha;
         * when that alpha is all zero, or the entry has fewer bits, the AND
         * mask decides which pixels are transparent.
         * @throws PixForgeException (DecodeFailed)
         */
        static cv::Mat decodeLargestImage(const std::vector<unsigned char>& ico);

        /**
         * @brief Number of images listed in the directory of an ICO file.
         */
        static int imageCount(const std::vector<unsigned char>& ico);

        static constexpr std::size_t HEADER_SIZE = 6;
        static constexpr std::size_t ENTRY_SIZE = 16;
        static constexpr std::size_t BMP_FILE_HEADER_SIZE = 14;

    private:
        struct Entry
        {
            int width = 0;
            int height = 0;
            int bitCount = 0;
            std::uint32_t size = 0;
            std::uint32_t offset = 0;
        };

        static std::vector<Entry> readDirectory(const std::vector<unsigned char>& ico);
        static cv::Mat decodeDib(const std::vector<unsigned char>& dib);
        static std::vector<unsigned char> dibToBmp(const std::vector<unsigned char>& dib);
        static void applyAndMask(cv::Mat& bgra, const std::vector<unsigned char>& dib, std::size_t maskOffset);
    };

} // namespace PixForge
