#pragma once

// ─── Sparkline ↔ Eigen ──────────────────────────────────────────────────────
//
// Render Eigen float vectors without copying them into a std::vector. The
// storage is read in place through .data() / .size().
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DSPARKLINE_USE_EIGEN=ON
//
// Usage:
//
//   #include <sparkline/eigen.hpp>
//
//   Eigen::VectorXf prices = ...;
//   sparkline::SparklineRenderer renderer;
//   sparkline::render(renderer, canvas, prices, {300.0f, 100.0f});
//
// ─────────────────────────────────────────────────────────────────────────────

#include <cstddef>
#include <eigen3/Eigen/Core>
#include <sparkline/export.hpp>
#include <sparkline/renderer.hpp>
#include <span>
#include <string>
#include <type_traits>

namespace sparkline
{

namespace eigen_detail
{

// Any dense Eigen expression with float scalar and one (or a dynamic number
// of) columns.
template <typename T, typename = void>
struct is_eigen_float_vector : std::false_type
{
};

template <typename T>
struct is_eigen_float_vector<
    T,
    std::enable_if_t<std::is_base_of_v<Eigen::DenseBase<std::decay_t<T>>, std::decay_t<T>>
                     && std::is_same_v<typename std::decay_t<T>::Scalar, float>
                     && (std::decay_t<T>::ColsAtCompileTime == 1
                         || std::decay_t<T>::ColsAtCompileTime == Eigen::Dynamic)>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_eigen_float_vector_v = is_eigen_float_vector<T>::value;

// Contiguous expressions only; strided maps need .eval() first.
template <typename Derived>
std::span<const float> to_span(const Eigen::PlainObjectBase<Derived>& v)
{
    static_assert(std::is_same_v<typename Derived::Scalar, float>,
                  "Sparkline Eigen adapter requires float scalar type. "
                  "Use .cast<float>() to convert.");
    return {v.data(), static_cast<size_t>(v.size())};
}

}   // namespace eigen_detail

// ─── Renderer Overloads ──────────────────────────────────────────────────────

template <typename Derived>
auto render(SparklineRenderer&                     renderer,
            Canvas&                                canvas,
            const Eigen::PlainObjectBase<Derived>& data,
            Size                                   size)
    -> std::enable_if_t<eigen_detail::is_eigen_float_vector_v<Derived>>
{
    renderer.render(canvas, eigen_detail::to_span(data), size);
}

template <typename Derived>
auto to_svg(const Eigen::PlainObjectBase<Derived>& data,
            Size                                   size,
            const SparklineStyle&                  style = {})
    -> std::enable_if_t<eigen_detail::is_eigen_float_vector_v<Derived>, std::string>
{
    return SvgExporter::to_string(eigen_detail::to_span(data), size, style);
}

}   // namespace sparkline
