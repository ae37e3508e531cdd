#include "PixelArtError.h"
#include "Sharpener.h"
#include "TestHarness.h"

namespace {

// Vertical step edge: columns [0, 3) are 100, columns [3, 6) are 150.
cv::Mat MakeStepImage(int channels)
{
  cv::Mat img(6, 6, channels == 4 ? CV_8UC4 : CV_8UC3, cv::Scalar(100, 100, 100, 255));
  img(cv::Rect(3, 0, 3, 6)).setTo(cv::Scalar(150, 150, 150, 255));
  return img;
}

int Green(const cv::Mat& img, int y, int x)
{
  if (img.channels() == 4) return img.at<cv::Vec4b>(y, x)[1];
  return img.at<cv::Vec3b>(y, x)[1];
}

bool SameImage(const cv::Mat& a, const cv::Mat& b)
{
  if (a.size() != b.size() || a.type() != b.type()) return false;
  cv::Mat diff;
  cv::absdiff(a, b, diff);
  return cv::countNonZero(diff.reshape(1)) == 0;
}

} // namespace

static void TestZeroAmountIsIdentity()
{
  const cv::Mat img = MakeStepImage(3);
  const cv::Mat out = Sharpener::Sharpen(img, 0);
  EXPECT_TRUE(out.data == img.data);
  EXPECT_TRUE(SameImage(out, img));
}

static void TestAmountOutOfRange()
{
  const cv::Mat img = MakeStepImage(3);
  EXPECT_THROWS_KIND(Sharpener::Sharpen(img, 101), ErrorKind::InvalidConfig);
  EXPECT_THROWS_KIND(Sharpener::Sharpen(img, -101), ErrorKind::InvalidConfig);
}

static void TestFlatImageUnchanged()
{
  const cv::Mat flat(5, 7, CV_8UC3, cv::Scalar(40, 90, 200));
  EXPECT_TRUE(SameImage(Sharpener::Sharpen(flat, 100), flat));
  EXPECT_TRUE(SameImage(Sharpener::Sharpen(flat, -100), flat));
}

static void TestPositiveRaisesEdgeContrast()
{
  const cv::Mat img = MakeStepImage(3);
  const cv::Mat mild = Sharpener::Sharpen(img, 50);
  const cv::Mat strong = Sharpener::Sharpen(img, 100);

  // Dark side of the edge gets darker, bright side brighter.
  EXPECT_TRUE(Green(mild, 2, 2) < 100);
  EXPECT_TRUE(Green(mild, 2, 3) > 150);
  EXPECT_TRUE(Green(strong, 2, 2) <= Green(mild, 2, 2));
  EXPECT_TRUE(Green(strong, 2, 3) >= Green(mild, 2, 3));

  // Away from the edge nothing moves.
  EXPECT_EQ(Green(strong, 2, 0), 100);
  EXPECT_EQ(Green(strong, 2, 5), 150);
}

static void TestNegativeSoftens()
{
  const cv::Mat img = MakeStepImage(3);
  const cv::Mat soft = Sharpener::Sharpen(img, -100);
  EXPECT_TRUE(Green(soft, 2, 2) > 100);
  EXPECT_TRUE(Green(soft, 2, 3) < 150);
}

static void TestAlphaUntouched()
{
  cv::Mat img = MakeStepImage(4);
  img.at<cv::Vec4b>(0, 0)[3] = 0;
  img.at<cv::Vec4b>(3, 3)[3] = 77;
  img.at<cv::Vec4b>(5, 2)[3] = 128;

  const cv::Mat out = Sharpener::Sharpen(img, 80);
  ASSERT_TRUE(out.type() == CV_8UC4);

  cv::Mat inAlpha, outAlpha;
  cv::extractChannel(img, inAlpha, 3);
  cv::extractChannel(out, outAlpha, 3);
  EXPECT_TRUE(SameImage(inAlpha, outAlpha));
  EXPECT_TRUE(Green(out, 2, 3) > 150);
}

int main()
{
  TestZeroAmountIsIdentity();
  TestAmountOutOfRange();
  TestFlatImageUnchanged();
  TestPositiveRaisesEdgeContrast();
  TestNegativeSoftens();
  TestAlphaUntouched();

  return ReportAndExit("SharpenerTests");
}
