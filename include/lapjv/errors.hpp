#ifndef LAPJV_ERRORS_HPP
#define LAPJV_ERRORS_HPP

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace lapjv
{

class LapError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

class InvalidDimension final : public LapError
{
   public:
    using LapError::LapError;
};

class NonFiniteCost final : public LapError
{
   public:
    NonFiniteCost(const int row, const int col, const double value)
    : LapError(fmt::format("Cost matrix entry ({}, {}) is not finite: {}", row, col, value)), m_row(row), m_col(col)
    {
    }

    int row() const
    {
        return m_row;
    }

    int col() const
    {
        return m_col;
    }

   private:
    int m_row{};
    int m_col{};
};

class SolverError final : public LapError
{
   public:
    using LapError::LapError;
};

}  // namespace lapjv

#endif  // LAPJV_ERRORS_HPP
