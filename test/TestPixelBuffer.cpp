#include "BaseTestFixture.h"

TEST(PixelBufferTest, EmptyMatIsRejected) {
    try {
        PixelBuffer buffer{cv::Mat()};
        FAIL() << "Expected DecodeFailed";
    } catch (const PixForgeException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeFailed);
    }
}

TEST(PixelBufferTest, LayoutFollowsChannelCount) {
    EXPECT_EQ(PixelBuffer(cv::Mat(4, 4, CV_8UC1)).layout(), ColorLayout::Gray);
    EXPECT_EQ(PixelBuffer(cv::Mat(4, 4, CV_8UC2)).layout(), ColorLayout::GrayAlpha);
    EXPECT_EQ(PixelBuffer(cv::Mat(4, 4, CV_8UC3)).layout(), ColorLayout::Rgb);
    EXPECT_EQ(PixelBuffer(cv::Mat(4, 4, CV_8UC4)).layout(), ColorLayout::Rgba);
    EXPECT_EQ(PixelBuffer(cv::Mat(4, 4, CV_16UC3)).layout(), ColorLayout::Other);
    EXPECT_EQ(PixelBuffer(cv::Mat(4, 4, CV_32FC1)).layout(), ColorLayout::Other);
}

TEST(PixelBufferTest, Dimensions) {
    PixelBuffer buffer(cv::Mat(30, 70, CV_8UC3));
    EXPECT_EQ(buffer.width(), 70);
    EXPECT_EQ(buffer.height(), 30);
}

TEST(PixelBufferTest, ToRgbaAddsOpaqueAlpha) {
    PixelBuffer rgb(cv::Mat(5, 5, CV_8UC3, cv::Scalar(10, 20, 30)));
    PixelBuffer rgba = rgb.toRgba();

    ASSERT_EQ(rgba.layout(), ColorLayout::Rgba);
    EXPECT_EQ(rgba.mat().at<cv::Vec4b>(2, 2), cv::Vec4b(10, 20, 30, 255));
}

TEST(PixelBufferTest, ToRgbDropsAlpha) {
    PixelBuffer rgba(cv::Mat(5, 5, CV_8UC4, cv::Scalar(10, 20, 30, 40)));
    PixelBuffer rgb = rgba.toLayout(ColorLayout::Rgb);

    ASSERT_EQ(rgb.layout(), ColorLayout::Rgb);
    EXPECT_EQ(rgb.mat().at<cv::Vec3b>(0, 0), cv::Vec3b(10, 20, 30));
}

TEST(PixelBufferTest, GrayIsReplicatedIntoColorChannels) {
    PixelBuffer gray(cv::Mat(5, 5, CV_8UC1, cv::Scalar(77)));
    PixelBuffer rgba = gray.toRgba();

    EXPECT_EQ(rgba.mat().at<cv::Vec4b>(4, 4), cv::Vec4b(77, 77, 77, 255));
}

TEST(PixelBufferTest, GrayAlphaKeepsItsAlpha) {
    PixelBuffer grayAlpha(cv::Mat(3, 3, CV_8UC2, cv::Scalar(50, 128)));
    PixelBuffer rgba = grayAlpha.toRgba();

    EXPECT_EQ(rgba.mat().at<cv::Vec4b>(1, 1), cv::Vec4b(50, 50, 50, 128));
}

TEST(PixelBufferTest, SixteenBitIsScaledToEightBit) {
    PixelBuffer deep(cv::Mat(3, 3, CV_16UC3, cv::Scalar(65535, 0, 257 * 100)));
    PixelBuffer rgb = deep.toLayout(ColorLayout::Rgb);

    ASSERT_EQ(rgb.mat().depth(), CV_8U);
    EXPECT_EQ(rgb.mat().at<cv::Vec3b>(0, 0), cv::Vec3b(255, 0, 100));
}

TEST(PixelBufferTest, SameLayoutReturnsIndependentCopy) {
    cv::Mat source(3, 3, CV_8UC3, cv::Scalar(1, 2, 3));
    PixelBuffer buffer(source);
    PixelBuffer copy = buffer.toLayout(ColorLayout::Rgb);

    source.setTo(cv::Scalar(9, 9, 9));
    EXPECT_EQ(copy.mat().at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));
}

TEST(PixelBufferTest, OtherIsNotAConversionTarget) {
    PixelBuffer buffer(cv::Mat(3, 3, CV_8UC3));
    try {
        buffer.toLayout(ColorLayout::Other);
        FAIL() << "Expected UnsupportedConversion";
    } catch (const PixForgeException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedConversion);
    }
}

TEST(PixelBufferTest, ResizedKeepsLayout) {
    PixelBuffer buffer(cv::Mat(300, 512, CV_8UC4, cv::Scalar(1, 2, 3, 4)));
    PixelBuffer small = buffer.resized(256, 256);

    EXPECT_EQ(small.width(), 256);
    EXPECT_EQ(small.height(), 256);
    EXPECT_EQ(small.layout(), ColorLayout::Rgba);
}
