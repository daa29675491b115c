#include "ContentClassifier.h"
#include <cstdlib>

namespace PixForge
{
    std::string contentCategoryName(ContentCategory category)
    {
        switch (category)
        {
            case ContentCategory::SimpleGraphics:     return "simple graphics";
            case ContentCategory::HorizontalGraphics: return "horizontal graphics";
            case ContentCategory::VerticalPattern:    return "vertical pattern";
            case ContentCategory::SmoothPhoto:        return "smooth photo";
            case ContentCategory::ComplexGeometry:    return "complex geometry";
            case ContentCategory::Mixed:              return "mixed";
        }
        return "mixed";
    }

    unsigned int ContentClassifier::pixelDifference(const cv::Vec4b& a, const cv::Vec4b& b)
    {
        unsigned int diff = 0;
        for (int c = 0; c < 4; ++c)
        {
            diff += static_cast<unsigned int>(std::abs(static_cast<int>(a[c]) - static_cast<int>(b[c])));
        }
        return diff;
    }

    ContentCategory ContentClassifier::classify(const PixelBuffer& buffer)
    {
        const int width = buffer.width();
        const int height = buffer.height();

        if (width <= SMALL_IMAGE_EDGE && height <= SMALL_IMAGE_EDGE)
        {
            return ContentCategory::SimpleGraphics;
        }

        // Missing alpha is treated as opaque, gray is replicated into R, G, B
        const PixelBuffer rgba = buffer.toRgba();
        const cv::Mat& px = rgba.mat();

        const int samples = std::max(std::min(width, height) / 4, MIN_SAMPLES_PER_AXIS);
        const int stepX = std::max(width / samples, 1);
        const int stepY = std::max(height / samples, 1);

        unsigned long long horizontalVariation = 0;
        unsigned long long sampleCount = 0;
        for (int y = 0; y < height; y += stepY)
        {
            for (int x = 1; x < width; x += stepX)
            {
                horizontalVariation += pixelDifference(px.at<cv::Vec4b>(y, x), px.at<cv::Vec4b>(y, x - 1));
                ++sampleCount;
            }
        }

        unsigned long long verticalVariation = 0;
        for (int y = 1; y < height; y += stepY)
        {
            for (int x = 0; x < width; x += stepX)
            {
                verticalVariation += pixelDifference(px.at<cv::Vec4b>(y, x), px.at<cv::Vec4b>(y - 1, x));
            }
        }

        if (sampleCount == 0)
        {
            return ContentCategory::SimpleGraphics;
        }

        // Both averages use the horizontal sample count
        const unsigned long long avgHorizontal = horizontalVariation / sampleCount;
        const unsigned long long avgVertical = verticalVariation / sampleCount;

        if (avgHorizontal < avgVertical / 2)
        {
            return ContentCategory::HorizontalGraphics;
        }
        if (avgVertical < avgHorizontal / 2)
        {
            return ContentCategory::VerticalPattern;
        }
        if (avgHorizontal < SMOOTH_THRESHOLD && avgVertical < SMOOTH_THRESHOLD)
        {
            return ContentCategory::SmoothPhoto;
        }
        if (avgHorizontal > BUSY_THRESHOLD && avgVertical > BUSY_THRESHOLD)
        {
            return ContentCategory::Mixed;
        }
        return ContentCategory::ComplexGeometry;
    }

} // namespace PixForge
