#include "ImageCodec.h"
#include "FormatSniffer.h"
#include "IcoContainer.h"
#include "GrayAlphaPng.h"
#include <opencv2/imgcodecs.hpp>

namespace PixForge
{
    std::shared_ptr<ImageCodec> makeDefaultCodec()
    {
        return std::make_shared<OpenCvCodec>();
    }

    PixelBuffer OpenCvCodec::decode(const std::vector<unsigned char>& bytes) const
    {
        cv::Mat img;
        try
        {
            if (FormatSniffer::detect(bytes) == FormatLabel::Ico)
            {
                img = IcoContainer::decodeLargestImage(bytes);
            }
            else
            {
                img = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
            }
        }
        catch (const cv::Exception& e)
        {
            throw PixForgeException(ErrorKind::DecodeFailed, std::string("OpenCV failed to decode image: ") + e.what());
        }

        if (img.empty())
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "OpenCV could not decode the image data.");
        }

        // OpenCV expands gray+alpha PNGs to BGRA
        if (img.channels() == 4 && GrayAlphaPng::isGrayAlpha(bytes))
        {
            cv::Mat grayAlpha(img.size(), CV_MAKETYPE(img.depth(), 2));
            const int fromTo[] = {0, 0, 3, 1};
            cv::mixChannels(&img, 1, &grayAlpha, 1, fromTo, 2);
            img = grayAlpha;
        }
        return PixelBuffer(img);
    }

    int OpenCvCodec::pngCompressionLevel(PngCompression compression)
    {
        switch (compression)
        {
            case PngCompression::Fast:    return 1;
            case PngCompression::Default: return 6;
            case PngCompression::Best:    return 9;
        }
        return 6;
    }

    int OpenCvCodec::pngFilterFlags(PngFilter filter)
    {
        switch (filter)
        {
            case PngFilter::NoFilter: return cv::IMWRITE_PNG_FILTER_NONE;
            case PngFilter::Sub:      return cv::IMWRITE_PNG_FILTER_SUB;
            case PngFilter::Up:       return cv::IMWRITE_PNG_FILTER_UP;
            case PngFilter::Average:  return cv::IMWRITE_PNG_FILTER_AVG;
            case PngFilter::Paeth:    return cv::IMWRITE_PNG_FILTER_PAETH;
            case PngFilter::Adaptive: return cv::IMWRITE_PNG_ALL_FILTERS;
        }
        return cv::IMWRITE_PNG_ALL_FILTERS;
    }

    std::vector<int> OpenCvCodec::encodeParams(const EncodeOptions& options)
    {
        switch (options.format)
        {
            case TargetFormat::Png:
                return {cv::IMWRITE_PNG_COMPRESSION, pngCompressionLevel(options.compression),
                        cv::IMWRITE_PNG_FILTER, pngFilterFlags(options.filter)};
            case TargetFormat::Jpeg:
                return {cv::IMWRITE_JPEG_QUALITY, options.quality};
            case TargetFormat::Webp:
                // libwebp's lossy scale starts at 1
                return {cv::IMWRITE_WEBP_QUALITY, std::max(options.quality, 1)};
            case TargetFormat::Gif:
                return {};
            case TargetFormat::Ico:
                return {cv::IMWRITE_PNG_COMPRESSION, pngCompressionLevel(PngCompression::Default)};
        }
        return {};
    }

    std::vector<unsigned char> OpenCvCodec::encodeWith(const std::string& extension, const cv::Mat& pixels, const std::vector<int>& params)
    {
        std::vector<unsigned char> bytes;
        try
        {
            if (!cv::imencode(extension, pixels, bytes, params))
            {
                throw PixForgeException(ErrorKind::EncodeFailed, "OpenCV refused to encode " + extension + " data.");
            }
        }
        catch (const cv::Exception& e)
        {
            throw PixForgeException(ErrorKind::EncodeFailed, "OpenCV failed to encode " + extension + ": " + e.what());
        }

        if (bytes.empty())
        {
            throw PixForgeException(ErrorKind::EncodeFailed, "OpenCV produced no " + extension + " data.");
        }
        return bytes;
    }

    std::vector<unsigned char> OpenCvCodec::encode(const PixelBuffer& pixels, const EncodeOptions& options) const
    {
        const std::vector<int> params = encodeParams(options);

        switch (options.format)
        {
            case TargetFormat::Png:
                // The OpenCV PNG writer has no gray+alpha mode
                if (pixels.layout() == ColorLayout::GrayAlpha)
                {
                    return GrayAlphaPng::encode(pixels.mat(), pngCompressionLevel(options.compression), options.filter);
                }
                return encodeWith(".png", pixels.mat(), params);

            case TargetFormat::Jpeg:
                return encodeWith(".jpg", pixels.mat(), params);

            case TargetFormat::Webp:
                return encodeWith(".webp", pixels.mat(), params);

            case TargetFormat::Gif:
                return encodeWith(".gif", pixels.mat(), params);

            case TargetFormat::Ico:
            {
                std::vector<unsigned char> png = encodeWith(".png", pixels.mat(), params);
                return IcoContainer::wrapPng(png, pixels.width(), pixels.height());
            }
        }
        throw PixForgeException(ErrorKind::UnsupportedTargetFormat, "no encoder for " + targetFormatName(options.format));
    }

} // namespace PixForge
