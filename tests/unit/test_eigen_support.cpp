#include <eigen3/Eigen/Core>
#include <gtest/gtest.h>
#include <sparkline/eigen.hpp>
#include <sparkline/recording_canvas.hpp>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace sparkline;

namespace
{

template <typename T, typename = void>
struct accepts_to_svg : std::false_type
{
};

template <typename T>
struct accepts_to_svg<T,
                      std::void_t<decltype(sparkline::to_svg(std::declval<const T&>(), Size{}))>>
    : std::true_type
{
};

template <typename T, typename = void>
struct accepts_render : std::false_type
{
};

template <typename T>
struct accepts_render<T,
                      std::void_t<decltype(sparkline::render(std::declval<SparklineRenderer&>(),
                                                             std::declval<Canvas&>(),
                                                             std::declval<const T&>(),
                                                             Size{}))>> : std::true_type
{
};

}   // anonymous namespace

// ─── Overload Constraints ────────────────────────────────────────────────────

TEST(EigenOverloads, FloatVectorsAreAccepted)
{
    EXPECT_TRUE(accepts_to_svg<Eigen::VectorXf>::value);
    EXPECT_TRUE(accepts_to_svg<Eigen::Vector4f>::value);
    EXPECT_TRUE(accepts_render<Eigen::VectorXf>::value);
    EXPECT_TRUE(accepts_render<Eigen::Vector4f>::value);
}

TEST(EigenOverloads, OtherScalarsDropOutOfOverloadSet)
{
    EXPECT_FALSE(eigen_detail::is_eigen_float_vector_v<Eigen::VectorXd>);
    EXPECT_FALSE(accepts_to_svg<Eigen::VectorXd>::value);
    EXPECT_FALSE(accepts_to_svg<Eigen::VectorXi>::value);
    EXPECT_FALSE(accepts_render<Eigen::VectorXd>::value);
    EXPECT_FALSE(accepts_render<Eigen::VectorXi>::value);
}

TEST(EigenOverloads, FixedMultiColumnMatrixIsRejected)
{
    EXPECT_FALSE(eigen_detail::is_eigen_float_vector_v<Eigen::Matrix2f>);
    EXPECT_FALSE(accepts_to_svg<Eigen::Matrix2f>::value);
}

// ─── to_span Tests ───────────────────────────────────────────────────────────

TEST(EigenToSpan, VectorXfZeroCopy)
{
    Eigen::VectorXf v(3);
    v << 10.0f, 20.0f, 30.0f;

    auto span = eigen_detail::to_span(v);
    EXPECT_EQ(span.size(), 3u);
    EXPECT_EQ(span.data(), v.data());
    EXPECT_FLOAT_EQ(span[2], 30.0f);
}

TEST(EigenToSpan, EmptyVector)
{
    Eigen::VectorXf v(0);
    EXPECT_EQ(eigen_detail::to_span(v).size(), 0u);
}

// ─── Rendering ───────────────────────────────────────────────────────────────

TEST(EigenRender, MatchesStdVectorRender)
{
    std::vector<float> samples = {0.0f, 1.0f, 1.5f, 2.0f, 0.0f, -1.0f};
    Eigen::VectorXf    v       = Eigen::Map<Eigen::VectorXf>(samples.data(), 6);

    SparklineStyle style;
    style.fill_mode   = FillMode::Below;
    style.points_mode = PointsMode::Last;
    SparklineRenderer renderer(style);

    RecordingCanvas from_eigen;
    RecordingCanvas from_vector;
    render(renderer, from_eigen, v, {300.0f, 100.0f});
    renderer.render(from_vector, samples, {300.0f, 100.0f});

    EXPECT_EQ(from_eigen.ops(), from_vector.ops());
}

TEST(EigenRender, LinSpacedToSvg)
{
    Eigen::VectorXf v   = Eigen::VectorXf::LinSpaced(50, 0.0f, 1.0f);
    std::string     svg = to_svg(v, {200.0f, 40.0f});
    EXPECT_NE(svg.find("viewBox=\"0 0 200 40\""), std::string::npos);
    EXPECT_NE(svg.find("<path"), std::string::npos);
}
