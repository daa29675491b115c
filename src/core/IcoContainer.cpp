#include "IcoContainer.h"
#include "../utils/Definitions.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace PixForge
{
    namespace
    {
        const unsigned char PNG_SIGNATURE[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

        std::uint16_t readU16(const std::vector<unsigned char>& data, std::size_t pos)
        {
            return static_cast<std::uint16_t>(data[pos] | (data[pos + 1] << 8));
        }

        std::uint32_t readU32(const std::vector<unsigned char>& data, std::size_t pos)
        {
            return static_cast<std::uint32_t>(data[pos]) |
                   (static_cast<std::uint32_t>(data[pos + 1]) << 8) |
                   (static_cast<std::uint32_t>(data[pos + 2]) << 16) |
                   (static_cast<std::uint32_t>(data[pos + 3]) << 24);
        }

        void writeU16(std::vector<unsigned char>& data, std::size_t pos, std::uint16_t value)
        {
            data[pos] = static_cast<unsigned char>(value & 0xFF);
            data[pos + 1] = static_cast<unsigned char>((value >> 8) & 0xFF);
        }

        void writeU32(std::vector<unsigned char>& data, std::size_t pos, std::uint32_t value)
        {
            for (int i = 0; i < 4; ++i)
            {
                data[pos + i] = static_cast<unsigned char>((value >> (8 * i)) & 0xFF);
            }
        }

        void appendU16(std::vector<unsigned char>& data, std::uint16_t value)
        {
            data.push_back(static_cast<unsigned char>(value & 0xFF));
            data.push_back(static_cast<unsigned char>((value >> 8) & 0xFF));
        }

        void appendU32(std::vector<unsigned char>& data, std::uint32_t value)
        {
            for (int i = 0; i < 4; ++i)
            {
                data.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xFF));
            }
        }

        bool isPng(const std::vector<unsigned char>& data, std::size_t offset)
        {
            if (data.size() < offset + sizeof(PNG_SIGNATURE)) return false;
            return std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), data.begin() + offset);
        }

        constexpr std::uint32_t BI_RGB = 0;
        constexpr std::uint32_t BI_BITFIELDS = 3;

        // Layout of an icon bitmap: header, palette, color plane, AND mask
        struct DibLayout
        {
            std::uint32_t headerSize = 0;
            int width = 0;
            int height = 0; // without the mask half
            int bitCount = 0;
            std::uint32_t compression = BI_RGB;
            std::uint64_t pixelOffset = 0;
            std::uint64_t colorStride = 0;
            std::uint64_t maskOffset = 0;
            std::uint64_t maskStride = 0;
        };

        DibLayout parseDib(const std::vector<unsigned char>& dib)
        {
            if (dib.size() < 40)
            {
                throw PixForgeException(ErrorKind::DecodeFailed, "ICO bitmap header is truncated.");
            }

            DibLayout layout;
            layout.headerSize = readU32(dib, 0);
            if (layout.headerSize < 40 || layout.headerSize > dib.size())
            {
                throw PixForgeException(ErrorKind::DecodeFailed, "ICO bitmap header size is invalid.");
            }

            // The stored height covers the color plane plus the AND mask
            auto width = static_cast<std::int32_t>(readU32(dib, 4));
            auto storedHeight = static_cast<std::int32_t>(readU32(dib, 8));
            if (width <= 0 || storedHeight < 2 || width > 0x10000 || storedHeight > 0x20000)
            {
                throw PixForgeException(ErrorKind::DecodeFailed,
                    "ICO bitmap size " + std::to_string(width) + "x" + std::to_string(storedHeight) + " is invalid.");
            }
            layout.width = width;
            layout.height = storedHeight / 2;
            layout.bitCount = readU16(dib, 14);
            layout.compression = readU32(dib, 16);

            std::uint32_t colorsUsed = readU32(dib, 32);
            std::uint64_t paletteBytes = 0;
            if (layout.bitCount <= 8)
            {
                if (colorsUsed > 256)
                {
                    throw PixForgeException(ErrorKind::DecodeFailed, "ICO bitmap palette is too large.");
                }
                paletteBytes = 4ull * (colorsUsed != 0 ? colorsUsed : (1u << layout.bitCount));
            }
            std::uint64_t maskBytes = (layout.compression == BI_BITFIELDS && layout.headerSize == 40) ? 12 : 0;

            layout.pixelOffset = layout.headerSize + paletteBytes + maskBytes;
            if (layout.pixelOffset > dib.size())
            {
                throw PixForgeException(ErrorKind::DecodeFailed, "ICO bitmap palette is truncated.");
            }

            // Rows are padded to 4 bytes
            layout.colorStride = ((static_cast<std::uint64_t>(layout.width) * layout.bitCount + 31) / 32) * 4;
            layout.maskOffset = layout.pixelOffset + layout.colorStride * static_cast<std::uint64_t>(layout.height);
            layout.maskStride = ((static_cast<std::uint64_t>(layout.width) + 31) / 32) * 4;
            return layout;
        }
    }

    std::vector<unsigned char> IcoContainer::wrapPng(const std::vector<unsigned char>& png, int width, int height)
    {
        if (width < 1 || height < 1 || width > Definitions::ICO_MAX_EDGE || height > Definitions::ICO_MAX_EDGE)
        {
            throw PixForgeException(ErrorKind::EncodeFailed,
                "ICO images must be 1-256 pixels per side, got " + std::to_string(width) + "x" + std::to_string(height) + ".");
        }
        if (!isPng(png, 0))
        {
            throw PixForgeException(ErrorKind::EncodeFailed, "ICO payload is not a PNG stream.");
        }

        std::vector<unsigned char> ico;
        ico.reserve(HEADER_SIZE + ENTRY_SIZE + png.size());

        // ICONDIR
        appendU16(ico, 0);  // reserved
        appendU16(ico, 1);  // type: icon
        appendU16(ico, 1);  // image count

        // ICONDIRENTRY, 256 is stored as 0
        ico.push_back(static_cast<unsigned char>(width == 256 ? 0 : width));
        ico.push_back(static_cast<unsigned char>(height == 256 ? 0 : height));
        ico.push_back(0);   // palette size
        ico.push_back(0);   // reserved
        appendU16(ico, 1);  // color planes
        appendU16(ico, 32); // bits per pixel
        appendU32(ico, static_cast<std::uint32_t>(png.size()));
        appendU32(ico, static_cast<std::uint32_t>(HEADER_SIZE + ENTRY_SIZE));

        ico.insert(ico.end(), png.begin(), png.end());
        return ico;
    }

    std::vector<IcoContainer::Entry> IcoContainer::readDirectory(const std::vector<unsigned char>& ico)
    {
        if (ico.size() < HEADER_SIZE)
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "ICO file is truncated.");
        }

        std::uint16_t reserved = readU16(ico, 0);
        std::uint16_t type = readU16(ico, 2);
        std::uint16_t count = readU16(ico, 4);
        if (reserved != 0 || (type != 1 && type != 2) || count == 0)
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "ICO directory header is invalid.");
        }
        if (ico.size() < HEADER_SIZE + ENTRY_SIZE * count)
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "ICO directory is truncated.");
        }

        std::vector<Entry> entries;
        entries.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            std::size_t pos = HEADER_SIZE + ENTRY_SIZE * i;
            Entry entry;
            entry.width = ico[pos] == 0 ? 256 : ico[pos];
            entry.height = ico[pos + 1] == 0 ? 256 : ico[pos + 1];
            entry.bitCount = readU16(ico, pos + 6);
            entry.size = readU32(ico, pos + 8);
            entry.offset = readU32(ico, pos + 12);

            if (entry.size == 0 ||
                static_cast<std::uint64_t>(entry.offset) + entry.size > ico.size())
            {
                throw PixForgeException(ErrorKind::DecodeFailed,
                    "ICO entry " + std::to_string(i) + " points outside the file.");
            }
            entries.push_back(entry);
        }
        return entries;
    }

    int IcoContainer::imageCount(const std::vector<unsigned char>& ico)
    {
        return static_cast<int>(readDirectory(ico).size());
    }

    std::vector<unsigned char> IcoContainer::largestEntryPayload(const std::vector<unsigned char>& ico)
    {
        std::vector<Entry> entries = readDirectory(ico);

        auto best = std::max_element(entries.begin(), entries.end(),
            [](const Entry& a, const Entry& b) {
                long areaA = static_cast<long>(a.width) * a.height;
                long areaB = static_cast<long>(b.width) * b.height;
                if (areaA != areaB) return areaA < areaB;
                return a.bitCount < b.bitCount;
            });

        return std::vector<unsigned char>(ico.begin() + best->offset,
                                          ico.begin() + best->offset + best->size);
    }

    cv::Mat IcoContainer::decodeLargestImage(const std::vector<unsigned char>& ico)
    {
        std::vector<unsigned char> payload = largestEntryPayload(ico);
        if (isPng(payload, 0))
        {
            cv::Mat img = cv::imdecode(payload, cv::IMREAD_UNCHANGED);
            if (img.empty())
            {
                throw PixForgeException(ErrorKind::DecodeFailed, "ICO entry holds an unreadable PNG stream.");
            }
            return img;
        }
        return decodeDib(payload);
    }

    cv::Mat IcoContainer::decodeDib(const std::vector<unsigned char>& dib)
    {
        const DibLayout layout = parseDib(dib);
        cv::Mat bgra;

        if (layout.bitCount == 32 && layout.compression == BI_RGB)
        {
            if (layout.maskOffset > dib.size())
            {
                throw PixForgeException(ErrorKind::DecodeFailed, "ICO bitmap pixels are truncated.");
            }

            // Bottom-up BGRA rows
            bgra.create(layout.height, layout.width, CV_8UC4);
            bool hasAlpha = false;
            for (int row = 0; row < layout.height; ++row)
            {
                const unsigned char* src = dib.data() + layout.pixelOffset + layout.colorStride * row;
                auto* dst = bgra.ptr<cv::Vec4b>(layout.height - 1 - row);
                for (int x = 0; x < layout.width; ++x)
                {
                    dst[x] = cv::Vec4b(src[4 * x], src[4 * x + 1], src[4 * x + 2], src[4 * x + 3]);
                    hasAlpha = hasAlpha || src[4 * x + 3] != 0;
                }
            }
            if (hasAlpha)
            {
                return bgra;
            }

            // Old-style 32-bit icons leave alpha at zero and rely on the mask
            cv::Mat opaque(bgra.size(), CV_8UC1, cv::Scalar(255));
            cv::insertChannel(opaque, bgra, 3);
        }
        else
        {
            cv::Mat color = cv::imdecode(dibToBmp(dib), cv::IMREAD_COLOR);
            if (color.empty() || color.cols != layout.width || color.rows != layout.height)
            {
                throw PixForgeException(ErrorKind::DecodeFailed, "ICO bitmap could not be decoded.");
            }
            cv::cvtColor(color, bgra, cv::COLOR_BGR2BGRA);
        }

        applyAndMask(bgra, dib, static_cast<std::size_t>(layout.maskOffset));
        return bgra;
    }

    void IcoContainer::applyAndMask(cv::Mat& bgra, const std::vector<unsigned char>& dib, std::size_t maskOffset)
    {
        const std::size_t stride = ((static_cast<std::size_t>(bgra.cols) + 31) / 32) * 4;

        // Some writers omit the mask; the image then stays opaque
        if (maskOffset > dib.size() || dib.size() - maskOffset < stride * static_cast<std::size_t>(bgra.rows))
        {
            return;
        }

        for (int row = 0; row < bgra.rows; ++row)
        {
            const unsigned char* bits = dib.data() + maskOffset + stride * row;
            auto* dst = bgra.ptr<cv::Vec4b>(bgra.rows - 1 - row);
            for (int x = 0; x < bgra.cols; ++x)
            {
                if ((bits[x / 8] >> (7 - x % 8)) & 1)
                {
                    dst[x][3] = 0;
                }
            }
        }
    }

    std::vector<unsigned char> IcoContainer::dibToBmp(const std::vector<unsigned char>& dib)
    {
        const DibLayout layout = parseDib(dib);

        std::vector<unsigned char> bitmap = dib;
        writeU32(bitmap, 8, static_cast<std::uint32_t>(layout.height));
        writeU32(bitmap, 20, 0); // image size, optional for uncompressed data

        std::vector<unsigned char> bmp(BMP_FILE_HEADER_SIZE);
        bmp[0] = 'B';
        bmp[1] = 'M';
        writeU32(bmp, 2, static_cast<std::uint32_t>(BMP_FILE_HEADER_SIZE + bitmap.size()));
        writeU16(bmp, 6, 0);
        writeU16(bmp, 8, 0);
        writeU32(bmp, 10, static_cast<std::uint32_t>(BMP_FILE_HEADER_SIZE + layout.pixelOffset));

        bmp.insert(bmp.end(), bitmap.begin(), bitmap.end());
        return bmp;
    }

} // namespace PixForge
