#include "BaseTestFixture.h"
#include "IcoContainer.h"
#include "ImageCodec.h"

namespace {

std::vector<unsigned char> encodePng(const cv::Mat& img) {
    std::vector<unsigned char> png;
    EXPECT_TRUE(cv::imencode(".png", img, png));
    return png;
}

void putU16(std::vector<unsigned char>& data, std::uint16_t value) {
    data.push_back(static_cast<unsigned char>(value & 0xFF));
    data.push_back(static_cast<unsigned char>(value >> 8));
}

void putU32(std::vector<unsigned char>& data, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        data.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xFF));
    }
}

std::uint32_t getU32(const std::vector<unsigned char>& data, std::size_t pos) {
    return data[pos] | (data[pos + 1] << 8) | (data[pos + 2] << 16) | (static_cast<std::uint32_t>(data[pos + 3]) << 24);
}

struct TestImage {
    int width;
    int height;
    std::vector<unsigned char> payload;
};

// Builds an ICO file from payloads in the given order
std::vector<unsigned char> buildIco(const std::vector<TestImage>& images) {
    std::vector<unsigned char> ico;
    putU16(ico, 0);
    putU16(ico, 1);
    putU16(ico, static_cast<std::uint16_t>(images.size()));

    std::uint32_t offset = static_cast<std::uint32_t>(IcoContainer::HEADER_SIZE + IcoContainer::ENTRY_SIZE * images.size());
    for (const auto& image : images) {
        ico.push_back(static_cast<unsigned char>(image.width == 256 ? 0 : image.width));
        ico.push_back(static_cast<unsigned char>(image.height == 256 ? 0 : image.height));
        ico.push_back(0);
        ico.push_back(0);
        putU16(ico, 1);
        putU16(ico, 32);
        putU32(ico, static_cast<std::uint32_t>(image.payload.size()));
        putU32(ico, offset);
        offset += static_cast<std::uint32_t>(image.payload.size());
    }
    for (const auto& image : images) {
        ico.insert(ico.end(), image.payload.begin(), image.payload.end());
    }
    return ico;
}

// 2x2 DIB as stored inside ICO files: doubled height, color rows bottom-up, then the AND mask
std::vector<unsigned char> makeDib(int bitCount, const std::vector<unsigned char>& pixels,
                                   const std::vector<unsigned char>& mask) {
    std::vector<unsigned char> dib;
    putU32(dib, 40);
    putU32(dib, 2);
    putU32(dib, 4);
    putU16(dib, 1);
    putU16(dib, static_cast<std::uint16_t>(bitCount));
    putU32(dib, 0); // BI_RGB
    putU32(dib, 0);
    putU32(dib, 0);
    putU32(dib, 0);
    putU32(dib, 0);
    putU32(dib, 0);
    dib.insert(dib.end(), pixels.begin(), pixels.end());
    dib.insert(dib.end(), mask.begin(), mask.end());
    return dib;
}

// Mask rows are 4-byte aligned; the top bit is the leftmost pixel
const std::vector<unsigned char> NO_MASK(8, 0);

void expectDecodeFailed(const std::vector<unsigned char>& ico) {
    try {
        IcoContainer::decodeLargestImage(ico);
        FAIL() << "Expected DecodeFailed";
    } catch (const PixForgeException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeFailed);
    }
}

} // namespace

// --- Writing ---

TEST(IcoContainerTest, WrapPngWritesDirectory) {
    auto png = encodePng(cv::Mat(16, 32, CV_8UC4, cv::Scalar(1, 2, 3, 4)));
    auto ico = IcoContainer::wrapPng(png, 32, 16);

    ASSERT_EQ(ico.size(), IcoContainer::HEADER_SIZE + IcoContainer::ENTRY_SIZE + png.size());
    std::vector<unsigned char> header(ico.begin(), ico.begin() + 6);
    EXPECT_EQ(header, (std::vector<unsigned char>{0, 0, 1, 0, 1, 0}));
    EXPECT_EQ(ico[6], 32);
    EXPECT_EQ(ico[7], 16);
    EXPECT_EQ(ico[12], 32); // bits per pixel
    EXPECT_EQ(getU32(ico, 14), png.size());
    EXPECT_EQ(getU32(ico, 18), 22u);
    EXPECT_TRUE(std::equal(png.begin(), png.end(), ico.begin() + 22));
}

TEST(IcoContainerTest, FullSizeIsStoredAsZero) {
    auto png = encodePng(cv::Mat(256, 256, CV_8UC4, cv::Scalar::all(0)));
    auto ico = IcoContainer::wrapPng(png, 256, 256);
    EXPECT_EQ(ico[6], 0);
    EXPECT_EQ(ico[7], 0);
}

TEST(IcoContainerTest, WrapPngRejectsOversizeImages) {
    auto png = encodePng(cv::Mat(4, 4, CV_8UC4, cv::Scalar::all(0)));
    try {
        IcoContainer::wrapPng(png, 257, 10);
        FAIL() << "Expected EncodeFailed";
    } catch (const PixForgeException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EncodeFailed);
    }
}

TEST(IcoContainerTest, WrapPngRejectsNonPngPayload) {
    std::vector<unsigned char> notPng = {'B', 'M', 0, 0, 0, 0, 0, 0, 0, 0};
    try {
        IcoContainer::wrapPng(notPng, 4, 4);
        FAIL() << "Expected EncodeFailed";
    } catch (const PixForgeException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EncodeFailed);
    }
}

// --- Reading ---

TEST(IcoContainerTest, ExtractsEmbeddedPng) {
    auto png = encodePng(cv::Mat(8, 8, CV_8UC4, cv::Scalar(9, 8, 7, 6)));
    auto extracted = IcoContainer::largestEntryPayload(IcoContainer::wrapPng(png, 8, 8));
    EXPECT_EQ(extracted, png);
}

TEST(IcoContainerTest, PicksLargestEntry) {
    auto small = encodePng(cv::Mat(16, 16, CV_8UC4, cv::Scalar::all(1)));
    auto large = encodePng(cv::Mat(48, 48, CV_8UC4, cv::Scalar::all(2)));
    auto medium = encodePng(cv::Mat(32, 32, CV_8UC4, cv::Scalar::all(3)));
    auto ico = buildIco({{16, 16, small}, {48, 48, large}, {32, 32, medium}});

    EXPECT_EQ(IcoContainer::imageCount(ico), 3);
    EXPECT_EQ(IcoContainer::largestEntryPayload(ico), large);
    EXPECT_EQ(IcoContainer::decodeLargestImage(ico).cols, 48);
}

TEST(IcoContainerTest, PngEntryKeepsAlpha) {
    cv::Mat source(4, 4, CV_8UC4, cv::Scalar(9, 8, 7, 255));
    source.at<cv::Vec4b>(2, 1) = cv::Vec4b(9, 8, 7, 0);
    auto ico = IcoContainer::wrapPng(encodePng(source), 4, 4);

    PixelBuffer decoded = OpenCvCodec().decode(ico);
    ASSERT_EQ(decoded.layout(), ColorLayout::Rgba);
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(2, 1)[3], 0);
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(0, 0)[3], 255);
}

TEST(IcoContainerTest, Dib32KeepsPerPixelAlpha) {
    // Bottom row first: opaque, transparent; then the top row, both opaque
    std::vector<unsigned char> pixels = {
        10, 20, 30, 255,  10, 20, 30, 0,
        40, 50, 60, 255,  40, 50, 60, 128,
    };
    auto ico = buildIco({{2, 2, makeDib(32, pixels, NO_MASK)}});

    PixelBuffer decoded = OpenCvCodec().decode(ico);
    ASSERT_EQ(decoded.mat().channels(), 4);
    EXPECT_EQ(decoded.layout(), ColorLayout::Rgba);
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(1, 1), cv::Vec4b(10, 20, 30, 0));
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(1, 0), cv::Vec4b(10, 20, 30, 255));
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(0, 1), cv::Vec4b(40, 50, 60, 128));
}

TEST(IcoContainerTest, Dib32WithoutAlphaUsesAndMask) {
    std::vector<unsigned char> pixels = {
        10, 20, 30, 0,  10, 20, 30, 0,
        40, 50, 60, 0,  40, 50, 60, 0,
    };
    // Bottom-left pixel masked out
    std::vector<unsigned char> mask = {0x80, 0, 0, 0,  0, 0, 0, 0};
    cv::Mat decoded = IcoContainer::decodeLargestImage(buildIco({{2, 2, makeDib(32, pixels, mask)}}));

    ASSERT_EQ(decoded.type(), CV_8UC4);
    EXPECT_EQ(decoded.at<cv::Vec4b>(1, 0), cv::Vec4b(10, 20, 30, 0));
    EXPECT_EQ(decoded.at<cv::Vec4b>(1, 1), cv::Vec4b(10, 20, 30, 255));
    EXPECT_EQ(decoded.at<cv::Vec4b>(0, 0), cv::Vec4b(40, 50, 60, 255));
    EXPECT_EQ(decoded.at<cv::Vec4b>(0, 1), cv::Vec4b(40, 50, 60, 255));
}

TEST(IcoContainerTest, Dib24TakesAlphaFromAndMask) {
    // 24-bit rows are padded from 6 to 8 bytes
    std::vector<unsigned char> pixels = {
        10, 20, 30,  11, 21, 31,  0, 0,
        40, 50, 60,  41, 51, 61,  0, 0,
    };
    // Top-right pixel masked out
    std::vector<unsigned char> mask = {0, 0, 0, 0,  0x40, 0, 0, 0};
    auto ico = buildIco({{2, 2, makeDib(24, pixels, mask)}});

    PixelBuffer decoded = OpenCvCodec().decode(ico);
    ASSERT_EQ(decoded.layout(), ColorLayout::Rgba);
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(1, 0), cv::Vec4b(10, 20, 30, 255));
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(1, 1), cv::Vec4b(11, 21, 31, 255));
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(0, 0), cv::Vec4b(40, 50, 60, 255));
    EXPECT_EQ(decoded.mat().at<cv::Vec4b>(0, 1), cv::Vec4b(41, 51, 61, 0));
}

TEST(IcoContainerTest, Dib24WithoutMaskStaysOpaque) {
    std::vector<unsigned char> pixels = {
        10, 20, 30,  11, 21, 31,  0, 0,
        40, 50, 60,  41, 51, 61,  0, 0,
    };
    cv::Mat decoded = IcoContainer::decodeLargestImage(buildIco({{2, 2, makeDib(24, pixels, {})}}));

    ASSERT_EQ(decoded.type(), CV_8UC4);
    cv::Mat alpha;
    cv::extractChannel(decoded, alpha, 3);
    EXPECT_EQ(cv::countNonZero(alpha == 255), 4);
}

TEST(IcoContainerTest, MalformedDirectoriesFailToDecode) {
    expectDecodeFailed({0, 0, 1});                      // shorter than the header
    expectDecodeFailed({0, 0, 1, 0, 0, 0});             // no images
    expectDecodeFailed({0, 0, 1, 0, 2, 0, 16, 16, 0});  // truncated entries
    expectDecodeFailed({1, 0, 1, 0, 1, 0});             // reserved field set
}

TEST(IcoContainerTest, EntryOutsideFileFailsToDecode) {
    auto png = encodePng(cv::Mat(8, 8, CV_8UC4, cv::Scalar::all(0)));
    auto ico = IcoContainer::wrapPng(png, 8, 8);
    ico.resize(ico.size() - 10);
    expectDecodeFailed(ico);
}

TEST(IcoContainerTest, TruncatedDibFailsToDecode) {
    std::vector<unsigned char> shortDib(20, 0);
    expectDecodeFailed(buildIco({{2, 2, shortDib}}));

    // Header intact, 32-bit pixel rows cut short
    std::vector<unsigned char> halfPixels(8, 0xFF);
    expectDecodeFailed(buildIco({{2, 2, makeDib(32, halfPixels, {})}}));
}
