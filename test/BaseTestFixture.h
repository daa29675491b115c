#pragma once

#include "gtest/gtest.h"
#include "Common.h"
#include "FileSystemEntries.h"
#include "FormatSniffer.h"
#include "PixelBuffer.h"
#include "FormatConverter.h"
#include "BatchRunner.h"
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <functional>

// Use the project's namespace
using namespace PixForge;

/**
 * @brief A base test fixture for all PixForge tests.
 *
 * Creates a scratch directory with a few generated images and non-image
 * files before each test (`SetUp`) and deletes it afterwards (`TearDown`).
 */
class BaseTestFixture : public ::testing::Test {
protected:
    // --- Paths ---
    fs::path tempDir;
    fs::path subdirPath;
    fs::path outputDir;

    // --- Test File Paths ---
    fs::path fileA_txt;
    fs::path fakePng;
    fs::path imgRed_png;
    fs::path imgGreen_jpg;
    fs::path imgBlue_png;
    fs::path imgTransparent_png;
    fs::path imgGray_png;

    /**
     * @brief Writes raw bytes to a file.
     */
    static void writeBytes(const fs::path& path, const std::vector<unsigned char>& bytes) {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    static void writeText(const fs::path& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    static void saveImage(const fs::path& path, const cv::Mat& img) {
        ASSERT_TRUE(cv::imwrite(path.string(), img)) << "Failed to create test image " << path.string();
    }

    /**
     * @brief Smooth BGRA gradient whose alpha also varies, so encoders keep the
     * alpha plane.
     */
    static cv::Mat makeGradientRgba(int width, int height) {
        cv::Mat img(height, width, CV_8UC4);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                img.at<cv::Vec4b>(y, x) = cv::Vec4b(
                    static_cast<uchar>(x * 255 / std::max(width - 1, 1)),
                    static_cast<uchar>(y * 255 / std::max(height - 1, 1)),
                    128,
                    static_cast<uchar>(128 + (x * 127) / std::max(width - 1, 1)));
            }
        }
        return img;
    }

    /**
     * @brief Expects fn to throw a PixForgeException of the given kind.
     */
    static void expectKind(const std::function<void()>& fn, ErrorKind kind) {
        try {
            fn();
            FAIL() << "Expected PixForgeException (" << errorKindName(kind) << ")";
        } catch (const PixForgeException& e) {
            EXPECT_EQ(e.kind(), kind) << e.what();
        }
    }

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir = fs::temp_directory_path() / "PixForgeTest" / (std::string(info->test_suite_name()) + "_" + info->name());
        fs::remove_all(tempDir);
        fs::create_directories(tempDir);

        subdirPath = tempDir / "subdirectory";
        outputDir = tempDir / "output";
        fs::create_directory(subdirPath);
        fs::create_directory(outputDir);

        // --- Non-image files ---
        fileA_txt = tempDir / "file_a.txt";
        writeText(fileA_txt, "just some notes");
        fakePng = tempDir / "not_really.png";
        writeText(fakePng, "this is plain text with an image extension");

        // --- Test images ---
        imgRed_png = tempDir / "red_100x100.png";
        imgGreen_jpg = tempDir / "green_150x80.jpg";
        imgBlue_png = subdirPath / "blue_50x50.png";
        imgTransparent_png = tempDir / "transparent_50x50.png";
        imgGray_png = tempDir / "gray_120x90.png";

        saveImage(imgRed_png, cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 255)));
        saveImage(imgGreen_jpg, cv::Mat(80, 150, CV_8UC3, cv::Scalar(0, 255, 0)));
        saveImage(imgBlue_png, cv::Mat(50, 50, CV_8UC3, cv::Scalar(255, 0, 0)));
        saveImage(imgTransparent_png, cv::Mat(50, 50, CV_8UC4, cv::Scalar(0, 0, 255, 128)));
        saveImage(imgGray_png, cv::Mat(90, 120, CV_8UC1, cv::Scalar(77)));
    }

    void TearDown() override {
        if (fs::exists(tempDir)) {
            fs::remove_all(tempDir);
        }
    }
};
