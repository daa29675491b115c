#include "FormatConverter.h"
#include "FileSystemEntries.h"
#include "FormatSniffer.h"
#include "ContentClassifier.h"
#include "EncodingPolicy.h"

namespace PixForge
{
    namespace
    {
        [[noreturn]] void rethrowFor(const fs::path& inputPath, const PixForgeException& e)
        {
            throw PixForgeException(e.kind(), "Conversion failed for " + inputPath.string() + ": " + e.detail());
        }
    }

    ImageConverter::ImageConverter(std::shared_ptr<ImageCodec> codec)
        : m_codec(std::move(codec))
    {
        if (!m_codec)
        {
            m_codec = makeDefaultCodec();
        }
    }

    fs::path ImageConverter::resolveOutputPath(const fs::path& inputPath,
                                               const fs::path& outputPath,
                                               const std::string& targetFormat)
    {
        std::error_code ec;
        if (fs::is_directory(outputPath, ec))
        {
            return outputPath / FileSystemEntries::changeExtension(inputPath, to_lower(targetFormat));
        }
        return outputPath;
    }

    fs::path ImageConverter::convertOne(const fs::path& inputPath,
                                        const fs::path& outputPath,
                                        const std::string& targetFormat,
                                        int quality) const
    {
        // 1. Check the output format
        auto target = parseTargetFormat(targetFormat);
        if (!target)
        {
            throw PixForgeException(ErrorKind::UnsupportedTargetFormat, "Unsupported output format: " + targetFormat);
        }

        // 2. Eligibility: extension allowlist plus content signature
        std::error_code ec;
        std::optional<FormatLabel> detected;
        if (fs::is_regular_file(inputPath, ec) && FormatSniffer::hasPotentialImageExtension(inputPath))
        {
            detected = FormatSniffer::detectFile(inputPath);
        }
        if (!detected)
        {
            throw PixForgeException(ErrorKind::UnsupportedInputContent, "Unsupported image format: " + inputPath.string());
        }

        // 3. Vector input is out of scope
        if (*detected == FormatLabel::Svg || FileSystemEntries::getExtension(inputPath) == "svg")
        {
            throw PixForgeException(ErrorKind::UnsupportedConversion, "svg not supported: " + inputPath.string());
        }

        try
        {
            // 4. Decode
            PixelBuffer pixels = m_codec->decode(FileSystemEntries::readFile(inputPath));

            // 5. Resolve the destination
            fs::path destination = resolveOutputPath(inputPath, outputPath, targetFormat);
            FileSystemEntries::ensureDirectoryExists(destination);

            // 6. Classify, pick options, encode in memory, then write
            ContentCategory category = ContentClassifier::classify(pixels);
            EncodeOptions options = EncodingPolicy::decide(*target, quality, category, pixels.layout(),
                                                           cv::Size(pixels.width(), pixels.height()));
            std::vector<unsigned char> encoded = m_codec->encode(EncodingPolicy::prepare(pixels, options), options);
            FileSystemEntries::writeFile(destination, encoded);

            return destination;
        }
        catch (const PixForgeException& e)
        {
            rethrowFor(inputPath, e);
        }
        catch (const cv::Exception& e)
        {
            // Pixel conversion or resampling in EncodingPolicy::prepare
            rethrowFor(inputPath, PixForgeException(ErrorKind::EncodeFailed, e.what()));
        }
    }

} // namespace PixForge
