#pragma once
#include "ContentClassifier.h"
#include <optional>

namespace PixForge
{
    /**
     * @brief Formats the encoder can produce. "jpg" and "jpeg" both map to Jpeg.
     */
    enum class TargetFormat
    {
        Png,
        Jpeg,
        Gif,
        Webp,
        Ico
    };

    /**
     * @brief Parses a target format name, case-insensitively.
     * @return std::nullopt for anything outside png, jpeg, jpg, gif, webp, ico.
     */
    std::optional<TargetFormat> parseTargetFormat(const std::string& name);

    std::string targetFormatName(TargetFormat format);

    enum class PngCompression
    {
        Fast,
        Default,
        Best
    };

    /**
     * @brief PNG scanline filter. Adaptive lets the writer pick the best of
     * the five filters for every scanline.
     */
    enum class PngFilter
    {
        NoFilter,
        Sub,
        Up,
        Average,
        Paeth,
        Adaptive
    };

    /**
     * @brief Everything the encoder needs besides the pixels.
     */
    struct EncodeOptions
    {
        TargetFormat format = TargetFormat::Png;
        int quality = 80;                         ///< JPEG / WEBP quality, 0-100
        PngCompression compression = PngCompression::Default;
        PngFilter filter = PngFilter::Adaptive;
        ColorLayout layout = ColorLayout::Rgba;   ///< Layout the pixels are converted to
        std::optional<cv::Size> targetDimensions; ///< Resize before encoding when set
    };

    /**
     * @brief Maps target format, quality, content category and source layout
     * to concrete encoder options.
     */
    class EncodingPolicy
    {
    public:
        static EncodeOptions decide(TargetFormat format,
                                    int quality,
                                    ContentCategory category,
                                    ColorLayout sourceLayout,
                                    cv::Size sourceDimensions);

        /**
         * @brief String overload.
         * @throws PixForgeException (UnsupportedTargetFormat) for unknown names.
         */
        static EncodeOptions decide(const std::string& format,
                                    int quality,
                                    ContentCategory category,
                                    ColorLayout sourceLayout,
                                    cv::Size sourceDimensions);

        /**
         * @brief Quality buckets: 0-20 Fast, 21-60 Default, 61-100 Best.
         *
         * Best is reached at 61, so qualities above 80 add nothing for PNG.
         */
        static PngCompression pngCompressionFor(int quality);

        static PngFilter pngFilterFor(ContentCategory category);

        /**
         * @brief Applies the layout conversion and resize an EncodeOptions asks for.
         */
        static PixelBuffer prepare(const PixelBuffer& source, const EncodeOptions& options);
    };

} // namespace PixForge
