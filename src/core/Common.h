#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <cctype>

#include <opencv2/core.hpp>

namespace fs = std::filesystem;

/**
 * @brief Global definitions and utilities for PixForge.
 */
namespace PixForge
{
    /**
     * @brief Failure categories of a conversion run.
     */
    enum class ErrorKind
    {
        InputNotFound,
        UnsupportedTargetFormat,
        UnsupportedInputContent,
        UnsupportedConversion,
        DecodeFailed,
        EncodeFailed,
        WriteFailed,
        DirectoryCreationFailed
    };

    /**
     * @brief Human-readable label for an ErrorKind.
     */
    inline const char* errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::InputNotFound:           return "input not found";
            case ErrorKind::UnsupportedTargetFormat: return "unsupported target format";
            case ErrorKind::UnsupportedInputContent: return "unsupported input content";
            case ErrorKind::UnsupportedConversion:   return "unsupported conversion";
            case ErrorKind::DecodeFailed:            return "decode failed";
            case ErrorKind::EncodeFailed:            return "encode failed";
            case ErrorKind::WriteFailed:             return "write failed";
            case ErrorKind::DirectoryCreationFailed: return "directory creation failed";
        }
        return "unknown error";
    }

    /**
     * @brief Exception raised for every file system, codec or validation error.
     */
    class PixForgeException : public std::runtime_error {
    public:
        PixForgeException(ErrorKind kind, const std::string& message)
            : std::runtime_error("PixForge Error: " + message), m_kind(kind), m_detail(message) {}

        ErrorKind kind() const noexcept { return m_kind; }

        // Message without the "PixForge Error: " prefix
        const std::string& detail() const noexcept { return m_detail; }

    private:
        ErrorKind m_kind;
        std::string m_detail;
    };

    /**
     * @brief Helper to convert a string to lowercase.
     */
    inline std::string to_lower(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return data;
    }

    inline std::string to_upper(const std::string& str) {
        std::string data = str;
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c){ return std::toupper(c); });
        return data;
    }

} // namespace PixForge
