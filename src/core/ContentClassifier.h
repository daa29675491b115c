#pragma once
#include "PixelBuffer.h"

namespace PixForge
{
    /**
     * @brief Spatial variation pattern of an image, used to pick a PNG filter.
     */
    enum class ContentCategory
    {
        SimpleGraphics,     // small or flat images, icons
        HorizontalGraphics, // wide horizontal bands
        VerticalPattern,    // column-wise structure
        SmoothPhoto,        // low variation in both directions
        ComplexGeometry,    // moderate variation
        Mixed               // high variation in both directions
    };

    std::string contentCategoryName(ContentCategory category);

    /**
     * @brief Samples pixel deltas to classify image content.
     */
    class ContentClassifier
    {
    public:
        /**
         * @brief Classifies a decoded image. Deterministic for a given buffer.
         *
         * Images of at most 64x64 are SimpleGraphics without sampling. Larger
         * images are sampled on a grid and the average left-neighbour and
         * upper-neighbour differences decide the category.
         */
        static ContentCategory classify(const PixelBuffer& buffer);

        /**
         * @brief Sum of absolute channel differences of two RGBA pixels.
         */
        static unsigned int pixelDifference(const cv::Vec4b& a, const cv::Vec4b& b);

        static constexpr int SMALL_IMAGE_EDGE = 64;
        static constexpr int MIN_SAMPLES_PER_AXIS = 10;
        static constexpr unsigned long long SMOOTH_THRESHOLD = 10;
        static constexpr unsigned long long BUSY_THRESHOLD = 50;
    };

} // namespace PixForge
