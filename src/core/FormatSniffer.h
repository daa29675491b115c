#pragma once
#include "Common.h"
#include <optional>

namespace PixForge
{
    /**
     * @brief Image container formats recognised from file content.
     */
    enum class FormatLabel
    {
        Png,
        Jpeg,
        Gif,
        Webp,
        Ico,
        Bmp,
        Tiff,
        Svg
    };

    /**
     * @brief Lower-case name of a format label ("png", "jpeg", ...).
     */
    std::string formatLabelName(FormatLabel label);

    /**
     * @brief Detects image formats from leading bytes, independent of the
     * file extension.
     */
    class FormatSniffer
    {
    public:
        /**
         * @brief Matches the head of a file against the signature table.
         * @param bytes The first bytes of the file (16 are enough).
         * @return The detected format, or std::nullopt when fewer than 4 bytes
         * are given or nothing matches.
         */
        static std::optional<FormatLabel> detect(const std::vector<unsigned char>& bytes);

        /**
         * @brief Reads the head of a file and runs detect() on it.
         * @return std::nullopt if the file cannot be read or is not an image.
         */
        static std::optional<FormatLabel> detectFile(const fs::path& path);

        /**
         * @brief True if the extension is in the allowlist (case-insensitive)
         * or the path has no extension at all.
         */
        static bool hasPotentialImageExtension(const fs::path& path);

        /**
         * @brief Eligibility gate: regular file, potential image extension, and
         * content recognised by detectFile().
         */
        static bool isImageFile(const fs::path& path);

    private:
        static bool isSvgText(const std::vector<unsigned char>& bytes);
        static bool isValidUtf8(const std::vector<unsigned char>& bytes);
    };

} // namespace PixForge
