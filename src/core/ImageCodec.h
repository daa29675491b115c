#pragma once
#include "PixelBuffer.h"
#include "EncodingPolicy.h"
#include <memory>

namespace PixForge
{
    /**
     * @brief Decode/encode capability used by the conversion pipeline.
     */
    class ImageCodec
    {
    public:
        virtual ~ImageCodec() = default;

        /**
         * @brief Decodes a complete image file held in memory.
         * @throws PixForgeException (DecodeFailed)
         */
        virtual PixelBuffer decode(const std::vector<unsigned char>& bytes) const = 0;

        /**
         * @brief Encodes pixels that were already prepared by EncodingPolicy::prepare.
         * @throws PixForgeException (EncodeFailed)
         */
        virtual std::vector<unsigned char> encode(const PixelBuffer& pixels, const EncodeOptions& options) const = 0;
    };

    /**
     * @brief ImageCodec backed by OpenCV's imgcodecs module.
     */
    class OpenCvCodec : public ImageCodec
    {
    public:
        PixelBuffer decode(const std::vector<unsigned char>& bytes) const override;
        std::vector<unsigned char> encode(const PixelBuffer& pixels, const EncodeOptions& options) const override;

        static int pngCompressionLevel(PngCompression compression);
        static int pngFilterFlags(PngFilter filter);

        /**
         * @brief imencode parameter list for the given options.
         */
        static std::vector<int> encodeParams(const EncodeOptions& options);

    private:
        static std::vector<unsigned char> encodeWith(const std::string& extension, const cv::Mat& pixels, const std::vector<int>& params);
    };

    std::shared_ptr<ImageCodec> makeDefaultCodec();

} // namespace PixForge
