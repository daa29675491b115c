#include "EncodingPolicy.h"
#include "../utils/Definitions.h"

namespace PixForge
{
    std::optional<TargetFormat> parseTargetFormat(const std::string& name)
    {
        std::string format = to_lower(name);
        if (format == "png")                     return TargetFormat::Png;
        if (format == "jpeg" || format == "jpg") return TargetFormat::Jpeg;
        if (format == "gif")                     return TargetFormat::Gif;
        if (format == "webp")                    return TargetFormat::Webp;
        if (format == "ico")                     return TargetFormat::Ico;
        return std::nullopt;
    }

    std::string targetFormatName(TargetFormat format)
    {
        switch (format)
        {
            case TargetFormat::Png:  return "png";
            case TargetFormat::Jpeg: return "jpeg";
            case TargetFormat::Gif:  return "gif";
            case TargetFormat::Webp: return "webp";
            case TargetFormat::Ico:  return "ico";
        }
        return "png";
    }

    PngCompression EncodingPolicy::pngCompressionFor(int quality)
    {
        if (quality <= 20) return PngCompression::Fast;
        if (quality <= 60) return PngCompression::Default;
        return PngCompression::Best;
    }

    PngFilter EncodingPolicy::pngFilterFor(ContentCategory category)
    {
        switch (category)
        {
            case ContentCategory::SimpleGraphics:     return PngFilter::NoFilter;
            case ContentCategory::HorizontalGraphics: return PngFilter::Sub;
            case ContentCategory::VerticalPattern:    return PngFilter::Up;
            case ContentCategory::SmoothPhoto:        return PngFilter::Average;
            case ContentCategory::ComplexGeometry:    return PngFilter::Paeth;
            case ContentCategory::Mixed:              return PngFilter::Adaptive;
        }
        return PngFilter::Adaptive;
    }

    EncodeOptions EncodingPolicy::decide(TargetFormat format,
                                         int quality,
                                         ContentCategory category,
                                         ColorLayout sourceLayout,
                                         cv::Size sourceDimensions)
    {
        EncodeOptions options;
        options.format = format;
        options.quality = std::clamp(quality, Definitions::MIN_QUALITY, Definitions::MAX_QUALITY);

        switch (format)
        {
            case TargetFormat::Jpeg:
                // JPEG has no alpha channel
                options.layout = ColorLayout::Rgb;
                break;

            case TargetFormat::Png:
                options.compression = pngCompressionFor(options.quality);
                options.filter = pngFilterFor(category);
                options.layout = (sourceLayout == ColorLayout::Other) ? ColorLayout::Rgba : sourceLayout;
                break;

            case TargetFormat::Webp:
                options.layout = ColorLayout::Rgba;
                break;

            case TargetFormat::Gif:
                // Palette quantisation works on the pixels as decoded
                options.layout = (sourceLayout == ColorLayout::Gray ||
                                  sourceLayout == ColorLayout::Rgb ||
                                  sourceLayout == ColorLayout::Rgba) ? sourceLayout : ColorLayout::Rgba;
                break;

            case TargetFormat::Ico:
                options.layout = ColorLayout::Rgba;
                if (sourceDimensions.width > Definitions::ICO_MAX_EDGE ||
                    sourceDimensions.height > Definitions::ICO_MAX_EDGE)
                {
                    options.targetDimensions = cv::Size(Definitions::ICO_MAX_EDGE, Definitions::ICO_MAX_EDGE);
                }
                break;
        }
        return options;
    }

    EncodeOptions EncodingPolicy::decide(const std::string& format,
                                         int quality,
                                         ContentCategory category,
                                         ColorLayout sourceLayout,
                                         cv::Size sourceDimensions)
    {
        auto target = parseTargetFormat(format);
        if (!target)
        {
            throw PixForgeException(ErrorKind::UnsupportedTargetFormat, "Unsupported output format: " + format);
        }
        return decide(*target, quality, category, sourceLayout, sourceDimensions);
    }

    PixelBuffer EncodingPolicy::prepare(const PixelBuffer& source, const EncodeOptions& options)
    {
        PixelBuffer prepared = source.toLayout(options.layout);
        if (options.targetDimensions)
        {
            return prepared.resized(options.targetDimensions->width, options.targetDimensions->height);
        }
        return prepared;
    }

} // namespace PixForge
