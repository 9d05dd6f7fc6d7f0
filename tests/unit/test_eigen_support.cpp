#include <eigen3/Eigen/Core>
#include <gtest/gtest.h>
#include <smoothie/eigen.hpp>
#include <smoothie/filters1d.hpp>
#include <smoothie/filters2d.hpp>

using namespace smoothie;

// ─── Conversions ────────────────────────────────────────────────────────────

TEST(EigenConvert, PointRoundTrip)
{
    Eigen::Vector2d v(1.5, -2.5);
    Point2          p = to_point(v);
    EXPECT_DOUBLE_EQ(p.x, 1.5);
    EXPECT_DOUBLE_EQ(p.y, -2.5);
    EXPECT_TRUE(to_eigen(p).isApprox(v));
}

// ─── Smoothing ──────────────────────────────────────────────────────────────

TEST(EigenSmooth, AddAndGet2D)
{
    Smoother2D s;
    s.attach(make_axis_pair<SimpleMovingAverageFilter1D>(std::size_t{2}));

    add_and_get(s, Eigen::Vector2d(0.0, 10.0));
    Eigen::Vector2d out = add_and_get(s, Eigen::Vector2d(2.0, 20.0));
    EXPECT_DOUBLE_EQ(out.x(), 1.0);
    EXPECT_DOUBLE_EQ(out.y(), 15.0);
    EXPECT_EQ(s.get(), Point2(1.0, 15.0));
}

TEST(EigenSmooth, VectorMatchesSampleBySample)
{
    Eigen::VectorXd trace(6);
    trace << 1.0, 4.0, 2.0, 8.0, 5.0, 7.0;

    Smoother1D a;
    a.attach(std::make_unique<MedianAverageFilter1D>(3));
    Smoother1D b;
    b.attach(std::make_unique<MedianAverageFilter1D>(3));

    Eigen::VectorXd out = smooth(a, trace);
    ASSERT_EQ(out.size(), trace.size());
    for (Eigen::Index i = 0; i < trace.size(); ++i)
        EXPECT_DOUBLE_EQ(out[i], b.add_and_get(trace[i]));
}

TEST(EigenSmooth, AcceptsExpressionsAndFloatInput)
{
    Eigen::VectorXf samples(3);
    samples << 2.0f, 4.0f, 6.0f;

    Smoother1D s;
    s.attach(std::make_unique<CumulativeMovingAverageFilter1D>());

    Eigen::VectorXd out = smooth(s, samples.segment(1, 2));
    ASSERT_EQ(out.size(), 2);
    EXPECT_DOUBLE_EQ(out[0], 4.0);
    EXPECT_DOUBLE_EQ(out[1], 5.0);
}

TEST(EigenSmooth, EmptyInput)
{
    Smoother1D s;
    Eigen::VectorXd out = smooth(s, Eigen::VectorXd());
    EXPECT_EQ(out.size(), 0);
    EXPECT_FALSE(s.has_value());
}
