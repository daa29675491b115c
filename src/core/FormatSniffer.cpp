#include "FormatSniffer.h"
#include "../utils/Definitions.h"
#include <fstream>

namespace PixForge
{
    namespace
    {
        using SecondaryCheck = bool (*)(const std::vector<unsigned char>&);

        struct ImageSignature
        {
            std::vector<unsigned char> prefix;
            FormatLabel label;
            SecondaryCheck check; // nullptr when the prefix alone is conclusive
        };

        // RIFF is a generic container; only "WEBP" at offset 8 makes it WebP.
        bool isWebpRiff(const std::vector<unsigned char>& bytes)
        {
            return bytes.size() >= 12 &&
                   bytes[8] == 'W' && bytes[9] == 'E' && bytes[10] == 'B' && bytes[11] == 'P';
        }

        // GIF87a or GIF89a
        bool isGifVersion(const std::vector<unsigned char>& bytes)
        {
            return bytes.size() >= 6 &&
                   bytes[0] == 'G' && bytes[1] == 'I' && bytes[2] == 'F' && bytes[3] == '8' &&
                   (bytes[4] == '7' || bytes[4] == '9') && bytes[5] == 'a';
        }

        // Checked in order; the first matching prefix decides.
        const std::vector<ImageSignature> IMAGE_SIGNATURES = {
            {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, FormatLabel::Png,  nullptr},
            {{0xFF, 0xD8, 0xFF},                               FormatLabel::Jpeg, nullptr},
            {{0x47, 0x49, 0x46, 0x38},                         FormatLabel::Gif,  isGifVersion},
            {{0x52, 0x49, 0x46, 0x46},                         FormatLabel::Webp, isWebpRiff},
            {{0x00, 0x00, 0x01, 0x00},                         FormatLabel::Ico,  nullptr},
            {{0x42, 0x4D},                                     FormatLabel::Bmp,  nullptr},
            {{0x49, 0x49, 0x2A, 0x00},                         FormatLabel::Tiff, nullptr},
            {{0x4D, 0x4D, 0x00, 0x2A},                         FormatLabel::Tiff, nullptr},
        };

        bool startsWith(const std::vector<unsigned char>& bytes, const std::vector<unsigned char>& prefix)
        {
            return bytes.size() >= prefix.size() &&
                   std::equal(prefix.begin(), prefix.end(), bytes.begin());
        }
    }

    std::string formatLabelName(FormatLabel label)
    {
        switch (label)
        {
            case FormatLabel::Png:  return "png";
            case FormatLabel::Jpeg: return "jpeg";
            case FormatLabel::Gif:  return "gif";
            case FormatLabel::Webp: return "webp";
            case FormatLabel::Ico:  return "ico";
            case FormatLabel::Bmp:  return "bmp";
            case FormatLabel::Tiff: return "tiff";
            case FormatLabel::Svg:  return "svg";
        }
        return "unknown";
    }

    std::optional<FormatLabel> FormatSniffer::detect(const std::vector<unsigned char>& bytes)
    {
        if (bytes.size() < 4)
        {
            return std::nullopt; // too small to be a valid image
        }

        for (const auto& signature : IMAGE_SIGNATURES)
        {
            if (startsWith(bytes, signature.prefix))
            {
                if (signature.check && !signature.check(bytes))
                {
                    return std::nullopt;
                }
                return signature.label;
            }
        }

        if (isSvgText(bytes))
        {
            return FormatLabel::Svg;
        }
        return std::nullopt;
    }

    std::optional<FormatLabel> FormatSniffer::detectFile(const fs::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            return std::nullopt;
        }

        std::vector<unsigned char> buffer(Definitions::SIGNATURE_SAMPLE_SIZE);
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        buffer.resize(static_cast<std::size_t>(file.gcount()));
        return detect(buffer);
    }

    bool FormatSniffer::hasPotentialImageExtension(const fs::path& path)
    {
        if (!path.has_extension())
        {
            return true; // no extension may still be an image
        }
        std::string ext = to_lower(path.extension().string().substr(1));
        const auto& allowed = Definitions::SUPPORTED_IMG_EXTENSIONS;
        return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
    }

    bool FormatSniffer::isImageFile(const fs::path& path)
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return false;
        }
        if (!hasPotentialImageExtension(path))
        {
            return false;
        }
        return detectFile(path).has_value();
    }

    bool FormatSniffer::isSvgText(const std::vector<unsigned char>& bytes)
    {
        if (!isValidUtf8(bytes))
        {
            return false;
        }
        std::string text = to_lower(std::string(bytes.begin(), bytes.end()));
        return text.rfind("<?xml", 0) == 0 || text.rfind("<svg", 0) == 0;
    }

    bool FormatSniffer::isValidUtf8(const std::vector<unsigned char>& bytes)
    {
        std::size_t i = 0;
        while (i < bytes.size())
        {
            unsigned char lead = bytes[i];
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            // Well-formed sequences only: no overlong forms, surrogates or
            // code points above U+10FFFF
            std::size_t length;
            unsigned char secondMin = 0x80;
            unsigned char secondMax = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF)      length = 2;
            else if (lead >= 0xE0 && lead <= 0xEF) length = 3;
            else if (lead >= 0xF0 && lead <= 0xF4) length = 4;
            else return false;

            if (lead == 0xE0)      secondMin = 0xA0;
            else if (lead == 0xED) secondMax = 0x9F;
            else if (lead == 0xF0) secondMin = 0x90;
            else if (lead == 0xF4) secondMax = 0x8F;

            if (i + length > bytes.size())
            {
                return false;
            }
            if (bytes[i + 1] < secondMin || bytes[i + 1] > secondMax)
            {
                return false;
            }
            for (std::size_t k = 2; k < length; ++k)
            {
                if ((bytes[i + k] & 0xC0) != 0x80)
                {
                    return false;
                }
            }
            i += length;
        }
        return true;
    }

} // namespace PixForge
