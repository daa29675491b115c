#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace PixForge
{
namespace Definitions
{

// --- Program ---
const std::string PROGRAM_NAME = "pixforge";
const std::string PROGRAM_VERSION = "0.1.0";

// --- Settings ---

// Formats accepted by --to. "jpg" and "jpeg" name the same encoder.
const std::vector<std::string> SUPPORTED_TARGET_FORMATS = {
    "png", "jpeg", "jpg", "gif", "webp", "ico"
};

// Extensions a file may carry to be considered for conversion.
// Files without any extension are also considered (content decides).
const std::vector<std::string> SUPPORTED_IMG_EXTENSIONS = {
    "png", "jpeg", "jpg", "gif", "webp", "svg", "ico",
    "bmp", "tiff", "tif", "avif", "heic", "heif"
};

const int DEFAULT_QUALITY = 80;
const int MIN_QUALITY = 0;
const int MAX_QUALITY = 100;

// Batch mode writes here (next to the input directory) when no output is given.
const std::string DEFAULT_BATCH_OUTPUT_DIR = "pixforge_output";

// Bytes read from the head of a file for signature sniffing.
const std::size_t SIGNATURE_SAMPLE_SIZE = 16;

// ICO entries cannot exceed 256x256.
const int ICO_MAX_EDGE = 256;

} // namespace Definitions
} // namespace PixForge
