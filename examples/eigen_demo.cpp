// Eigen integration demo: smooth Eigen vectors directly.
// Build with: cmake -DSMOOTHIE_USE_EIGEN=ON ..

#include <cmath>
#include <cstdio>
#include <eigen3/Eigen/Core>
#include <smoothie/eigen.hpp>
#include <smoothie/smoothie.hpp>

int main()
{
    const int       N     = 200;
    Eigen::VectorXd t     = Eigen::VectorXd::LinSpaced(N, 0.0, 4.0 * M_PI);
    Eigen::VectorXd noise = Eigen::VectorXd::Random(N) * 0.2;
    Eigen::VectorXd trace = t.array().sin().matrix() + noise;

    // ── 1D: whole trace through a Gaussian smoother ──
    auto gauss = smoothie::SmootherBuilder1D()
                     .attach(std::make_unique<smoothie::GaussianAverageFilter1D>(9))
                     .build();
    Eigen::VectorXd smoothed = smoothie::smooth(gauss, trace);

    const double raw_err      = (trace - t.array().sin().matrix()).norm();
    const double smoothed_err = (smoothed - t.array().sin().matrix()).norm();
    std::printf("residual norm: raw %.3f, smoothed %.3f\n", raw_err, smoothed_err);

    // ── 2D: sample by sample ──
    auto cursor = smoothie::SmootherBuilder2D()
                      .attach(smoothie::FilterConfig{smoothie::FilterType::ExponentialMovingAverage,
                                                     {.alpha = 0.25}})
                      .build();

    for (int i = 0; i < N; ++i)
    {
        Eigen::Vector2d p(std::cos(t[i]) * 100.0, std::sin(t[i]) * 100.0);
        Eigen::Vector2d out = smoothie::add_and_get(cursor, p);
        if (i % 20 == 0)
            std::printf("%4d  (%8.2f, %8.2f) -> (%8.2f, %8.2f)\n", i, p.x(), p.y(), out.x(), out.y());
    }

    return 0;
}
