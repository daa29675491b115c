#include "GrayAlphaPng.h"
#include <png.h>
#include <csetjmp>
#include <cstring>

namespace PixForge
{
    namespace
    {
        const unsigned char PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

        void appendToVector(png_structp png, png_bytep data, png_size_t length)
        {
            auto* out = static_cast<std::vector<unsigned char>*>(png_get_io_ptr(png));
            out->insert(out->end(), data, data + length);
        }

        void flushNothing(png_structp) {}

        void raiseLibpngError(png_structp png, png_const_charp message)
        {
            std::cerr << "ERROR: libpng: " << message << std::endl;
            png_longjmp(png, 1);
        }

        void logLibpngWarning(png_structp, png_const_charp message)
        {
            std::cerr << "Warning: libpng: " << message << std::endl;
        }
    }

    bool GrayAlphaPng::isGrayAlpha(const std::vector<unsigned char>& png)
    {
        if (png.size() <= COLOR_TYPE_OFFSET) return false;
        if (!std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), png.begin())) return false;
        if (std::memcmp(png.data() + 12, "IHDR", 4) != 0) return false;
        return png[COLOR_TYPE_OFFSET] == PNG_COLOR_TYPE_GRAY_ALPHA;
    }

    int GrayAlphaPng::filterFlags(PngFilter filter)
    {
        switch (filter)
        {
            case PngFilter::NoFilter: return PNG_FILTER_NONE;
            case PngFilter::Sub:      return PNG_FILTER_SUB;
            case PngFilter::Up:       return PNG_FILTER_UP;
            case PngFilter::Average:  return PNG_FILTER_AVG;
            case PngFilter::Paeth:    return PNG_FILTER_PAETH;
            case PngFilter::Adaptive: return PNG_ALL_FILTERS;
        }
        return PNG_ALL_FILTERS;
    }

    std::vector<unsigned char> GrayAlphaPng::encode(const cv::Mat& grayAlpha, int compressionLevel, PngFilter filter)
    {
        if (grayAlpha.empty() || grayAlpha.type() != CV_8UC2)
        {
            throw PixForgeException(ErrorKind::EncodeFailed, "gray+alpha PNG needs 8-bit 2-channel pixels.");
        }

        // Everything with a destructor lives outside the setjmp scope
        std::vector<unsigned char> out;
        std::vector<png_bytep> rows(static_cast<std::size_t>(grayAlpha.rows));
        for (int y = 0; y < grayAlpha.rows; ++y)
        {
            rows[y] = const_cast<png_bytep>(grayAlpha.ptr<unsigned char>(y));
        }

        png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, raiseLibpngError, logLibpngWarning);
        if (!png)
        {
            throw PixForgeException(ErrorKind::EncodeFailed, "libpng could not allocate a write struct.");
        }
        png_infop info = png_create_info_struct(png);
        if (!info)
        {
            png_destroy_write_struct(&png, nullptr);
            throw PixForgeException(ErrorKind::EncodeFailed, "libpng could not allocate an info struct.");
        }

        if (setjmp(png_jmpbuf(png)))
        {
            png_destroy_write_struct(&png, &info);
            throw PixForgeException(ErrorKind::EncodeFailed, "libpng failed to write gray+alpha PNG data.");
        }

        png_set_write_fn(png, &out, appendToVector, flushNothing);
        png_set_IHDR(png, info,
                     static_cast<png_uint_32>(grayAlpha.cols), static_cast<png_uint_32>(grayAlpha.rows),
                     8, PNG_COLOR_TYPE_GRAY_ALPHA, PNG_INTERLACE_NONE,
                     PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
        png_set_compression_level(png, std::clamp(compressionLevel, 0, 9));
        png_set_filter(png, PNG_FILTER_TYPE_BASE, filterFlags(filter));

        png_write_info(png, info);
        png_write_image(png, rows.data());
        png_write_end(png, nullptr);
        png_destroy_write_struct(&png, &info);

        if (out.empty())
        {
            throw PixForgeException(ErrorKind::EncodeFailed, "libpng produced no PNG data.");
        }
        return out;
    }

} // namespace PixForge
