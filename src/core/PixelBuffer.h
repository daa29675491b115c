#pragma once
#include "Common.h"

namespace PixForge
{
    /**
     * @brief Channel composition of a decoded image.
     *
     * Other covers anything that is not 8 bits per channel with 1-4 channels
     * (16-bit PNG, float TIFF, ...).
     */
    enum class ColorLayout
    {
        Gray,
        GrayAlpha,
        Rgb,
        Rgba,
        Other
    };

    std::string colorLayoutName(ColorLayout layout);

    /**
     * @brief Owned 2-D grid of decoded pixels.
     *
     * Channels are stored in OpenCV order (BGR / BGRA). A buffer is never
     * empty: constructing one from an empty Mat throws DecodeFailed.
     */
    class PixelBuffer
    {
    public:
        explicit PixelBuffer(cv::Mat pixels);

        int width() const { return m_pixels.cols; }
        int height() const { return m_pixels.rows; }
        ColorLayout layout() const { return m_layout; }
        const cv::Mat& mat() const { return m_pixels; }

        /**
         * @brief Returns an 8-bit copy in the requested layout.
         *
         * Alpha is dropped or added as fully opaque, gray is replicated into
         * the color channels. Requesting Other is an error.
         */
        PixelBuffer toLayout(ColorLayout target) const;

        PixelBuffer toRgba() const { return toLayout(ColorLayout::Rgba); }

        /**
         * @brief Returns a Lanczos-resampled copy of the given size.
         */
        PixelBuffer resized(int width, int height) const;

        static ColorLayout layoutOf(const cv::Mat& pixels);

    private:
        static cv::Mat toEightBit(const cv::Mat& pixels);

        cv::Mat m_pixels;
        ColorLayout m_layout;
    };

} // namespace PixForge
