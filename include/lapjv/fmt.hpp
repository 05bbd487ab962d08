#ifndef LAPJV_FMT_HPP
#define LAPJV_FMT_HPP

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <Eigen/Core>
#include <iostream>

namespace fmt
{

template <typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct formatter<Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>> : ostream_formatter
{
};

}  // namespace fmt

#endif  // LAPJV_FMT_HPP
