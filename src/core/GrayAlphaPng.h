#pragma once
#include "Common.h"
#include "EncodingPolicy.h"

namespace PixForge
{
    /**
     * @brief Gray+alpha PNG support that OpenCV lacks.
     *
     * imdecode expands color type 4 to BGRA and imencode cannot write it,
     * so 2-channel images are written through libpng directly.
     */
    class GrayAlphaPng
    {
    public:
        /**
         * @brief True when the bytes are a PNG whose IHDR declares gray+alpha.
         */
        static bool isGrayAlpha(const std::vector<unsigned char>& png);

        /**
         * @brief Writes an 8-bit, 2-channel image as a gray+alpha PNG.
         * @param grayAlpha CV_8UC2 pixels, channel 0 gray, channel 1 alpha.
         * @param compressionLevel zlib level, 0-9.
         * @throws PixForgeException (EncodeFailed)
         */
        static std::vector<unsigned char> encode(const cv::Mat& grayAlpha, int compressionLevel, PngFilter filter);

        static int filterFlags(PngFilter filter);

        static constexpr std::size_t COLOR_TYPE_OFFSET = 25;
    };

} // namespace PixForge
