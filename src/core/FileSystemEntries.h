#pragma once
#include "Common.h"

namespace PixForge
{
    /**
     * @brief A tool for the file system side of a conversion: path
     * resolution, directory creation, traversal and whole-file I/O.
     */
    class FileSystemEntries
    {
    public:
        // --- Paths ---

        /**
         * @brief Ensures the parent directory of a given file path exists.
         * @param filePath The full path to a file.
         * @throws PixForgeException (DirectoryCreationFailed)
         */
        static void ensureDirectoryExists(const fs::path& filePath);

        /**
         * @brief Creates a directory and all missing parents.
         * @throws PixForgeException (DirectoryCreationFailed)
         */
        static void createDirectory(const fs::path& directory);

        /**
         * @brief Converts a relative path to an absolute path.
         */
        static fs::path makeAbsolute(const fs::path& path);

        /**
         * @brief File name of path with its extension replaced, e.g.
         * ("dir/image.png", "webp") -> "image.webp".
         */
        static std::string changeExtension(const fs::path& path, const std::string& newExtension);

        /**
         * @brief Lower-case extension without the dot, or "" if there is none.
         */
        static std::string getExtension(const fs::path& path);

        // --- Traversal ---

        /**
         * @brief All regular files below directory, sorted by path.
         * Unreadable subdirectories are reported and skipped, the walk carries
         * on with their siblings. Symbolic links to directories are not followed.
         */
        static std::vector<fs::path> listFilesRecursive(const fs::path& directory);

        // --- Whole-file I/O ---

        /**
         * @throws PixForgeException (DecodeFailed) if the file cannot be read.
         */
        static std::vector<unsigned char> readFile(const fs::path& path);

        /**
         * @brief Writes bytes to path, replacing any existing file. A partially
         * written file is removed again on failure.
         * @throws PixForgeException (WriteFailed)
         */
        static void writeFile(const fs::path& path, const std::vector<unsigned char>& bytes);

    private:
        static void collectFiles(const fs::path& directory, std::vector<fs::path>& files);
    };

} // namespace PixForge
