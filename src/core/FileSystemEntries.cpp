#include "FileSystemEntries.h"
#include <fstream>
#include <iterator>

namespace PixForge
{
    // --- Paths ---

    void FileSystemEntries::ensureDirectoryExists(const fs::path& filePath)
    {
        fs::path directory = filePath.parent_path();
        if (!directory.empty())
        {
            createDirectory(directory);
        }
    }

    void FileSystemEntries::createDirectory(const fs::path& directory)
    {
        std::error_code ec;
        if (fs::is_directory(directory, ec))
        {
            return;
        }

        try
        {
            fs::create_directories(directory);
            std::cout << "Created directory: '" << directory.string() << "'." << std::endl;
        }
        catch (const std::exception& e)
        {
            throw PixForgeException(ErrorKind::DirectoryCreationFailed,
                "Could not create directory: " + directory.string() + ". Reason: " + e.what());
        }
    }

    fs::path FileSystemEntries::makeAbsolute(const fs::path& path)
    {
        return fs::absolute(path);
    }

    std::string FileSystemEntries::changeExtension(const fs::path& path, const std::string& newExtension)
    {
        std::string stem = path.stem().string();
        if (stem.empty())
        {
            stem = "output";
        }
        return stem + "." + newExtension;
    }

    std::string FileSystemEntries::getExtension(const fs::path& path)
    {
        if (!path.has_extension())
        {
            return "";
        }
        return to_lower(path.extension().string().substr(1));
    }

    // --- Traversal ---

    void FileSystemEntries::collectFiles(const fs::path& directory, std::vector<fs::path>& files)
    {
        std::error_code ec;
        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            std::cerr << "Warning: cannot scan directory " << directory.string() << ": " << ec.message() << std::endl;
            return;
        }

        // A failure only drops the rest of this directory, siblings are still walked
        for (fs::directory_iterator end; it != end;)
        {
            const fs::directory_entry& entry = *it;
            std::error_code typeEc;
            if (entry.is_symlink(typeEc))
            {
                // Links to files are converted, links to directories are not followed
                if (entry.is_regular_file(typeEc))
                {
                    files.push_back(entry.path());
                }
            }
            else if (entry.is_directory(typeEc))
            {
                collectFiles(entry.path(), files);
            }
            else if (entry.is_regular_file(typeEc))
            {
                files.push_back(entry.path());
            }

            it.increment(ec);
            if (ec)
            {
                std::cerr << "Warning: stopped scanning " << directory.string() << ": " << ec.message() << std::endl;
                return;
            }
        }
    }

    std::vector<fs::path> FileSystemEntries::listFilesRecursive(const fs::path& directory)
    {
        std::vector<fs::path> files;
        collectFiles(directory, files);

        // Directory iteration order is file system dependent
        std::sort(files.begin(), files.end());
        return files;
    }

    // --- Whole-file I/O ---

    std::vector<unsigned char> FileSystemEntries::readFile(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "Could not open file: " + path.string());
        }

        std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw PixForgeException(ErrorKind::DecodeFailed, "Could not read file: " + path.string());
        }
        return bytes;
    }

    void FileSystemEntries::writeFile(const fs::path& path, const std::vector<unsigned char>& bytes)
    {
        bool written = false;
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                throw PixForgeException(ErrorKind::WriteFailed, "Could not create output file: " + path.string());
            }
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            written = out.good();
        }

        if (!written)
        {
            // Devices and pipes are left in place
            std::error_code ec;
            if (fs::is_regular_file(path, ec))
            {
                fs::remove(path, ec);
            }
            throw PixForgeException(ErrorKind::WriteFailed, "Could not write output file: " + path.string());
        }
    }

} // namespace PixForge
