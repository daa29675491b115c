#include "PixelBuffer.h"
#include <opencv2/imgproc.hpp>

namespace PixForge
{
    std::string colorLayoutName(ColorLayout layout)
    {
        switch (layout)
        {
            case ColorLayout::Gray:      return "gray";
            case ColorLayout::GrayAlpha: return "gray+alpha";
            case ColorLayout::Rgb:       return "rgb";
            case ColorLayout::Rgba:      return "rgba";
            case ColorLayout::Other:     return "other";
        }
        return "other";
    }

    PixelBuffer::PixelBuffer(cv::Mat pixels)
        : m_pixels(std::move(pixels)), m_layout(ColorLayout::Other)
    {
        if (m_pixels.empty() || m_pixels.cols <= 0 || m_pixels.rows <= 0)
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "image has no pixels.");
        }
        m_layout = layoutOf(m_pixels);
    }

    ColorLayout PixelBuffer::layoutOf(const cv::Mat& pixels)
    {
        if (pixels.depth() != CV_8U)
        {
            return ColorLayout::Other;
        }
        switch (pixels.channels())
        {
            case 1: return ColorLayout::Gray;
            case 2: return ColorLayout::GrayAlpha;
            case 3: return ColorLayout::Rgb;
            case 4: return ColorLayout::Rgba;
            default: return ColorLayout::Other;
        }
    }

    cv::Mat PixelBuffer::toEightBit(const cv::Mat& pixels)
    {
        cv::Mat out;
        switch (pixels.depth())
        {
            case CV_8U:
                return pixels;
            case CV_16U:
                pixels.convertTo(out, CV_8U, 1.0 / 257.0);
                break;
            case CV_32F:
            case CV_64F:
                // Floating point samples are nominally in [0, 1]
                pixels.convertTo(out, CV_8U, 255.0);
                break;
            default:
                cv::normalize(pixels, out, 0, 255, cv::NORM_MINMAX, CV_8U);
                break;
        }
        return out;
    }

    PixelBuffer PixelBuffer::toLayout(ColorLayout target) const
    {
        if (target == ColorLayout::Other)
        {
            throw PixForgeException(ErrorKind::UnsupportedConversion, "cannot convert pixels to an unspecified layout.");
        }
        if (target == m_layout)
        {
            return PixelBuffer(m_pixels.clone());
        }

        cv::Mat src = toEightBit(m_pixels);

        // Separate the color planes from the alpha plane (if any)
        cv::Mat color, alpha;
        switch (src.channels())
        {
            case 1:
            case 3:
                color = src;
                break;
            case 2:
            {
                std::vector<cv::Mat> planes;
                cv::split(src, planes);
                color = planes[0];
                alpha = planes[1];
                break;
            }
            case 4:
                cv::cvtColor(src, color, cv::COLOR_BGRA2BGR);
                cv::extractChannel(src, alpha, 3);
                break;
            default:
                throw PixForgeException(ErrorKind::UnsupportedConversion,
                    "cannot convert an image with " + std::to_string(src.channels()) + " channels.");
        }

        bool targetGray = (target == ColorLayout::Gray || target == ColorLayout::GrayAlpha);
        bool targetAlpha = (target == ColorLayout::GrayAlpha || target == ColorLayout::Rgba);

        cv::Mat outColor;
        if (targetGray)
        {
            if (color.channels() == 1) outColor = color;
            else cv::cvtColor(color, outColor, cv::COLOR_BGR2GRAY);
        }
        else
        {
            if (color.channels() == 3) outColor = color;
            else cv::cvtColor(color, outColor, cv::COLOR_GRAY2BGR);
        }

        if (!targetAlpha)
        {
            return PixelBuffer(outColor.clone());
        }

        if (alpha.empty())
        {
            alpha = cv::Mat(src.size(), CV_8UC1, cv::Scalar(255));
        }

        std::vector<cv::Mat> planes;
        cv::split(outColor, planes);
        planes.push_back(alpha);
        cv::Mat merged;
        cv::merge(planes, merged);
        return PixelBuffer(merged);
    }

    PixelBuffer PixelBuffer::resized(int width, int height) const
    {
        cv::Mat out;
        cv::resize(m_pixels, out, cv::Size(width, height), 0, 0, cv::INTER_LANCZOS4);
        return PixelBuffer(out);
    }

} // namespace PixForge
