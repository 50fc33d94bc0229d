#ifndef SCALAR_OPS_HPP
#define SCALAR_OPS_HPP

#include <cmath>

// Scalar operations mapped over every element by Matrix::apply.

struct Negate
{
    [[nodiscard]] constexpr double operator()(double x) const noexcept
    {
        return -x;
    }
};

struct Exp
{
    [[nodiscard]] double operator()(double x) const noexcept
    {
        return std::exp(x);
    }
};

struct Log2
{
    [[nodiscard]] double operator()(double x) const noexcept
    {
        return std::log2(x);
    }
};

struct OnePlus
{
    [[nodiscard]] constexpr double operator()(double x) const noexcept
    {
        return 1.0 + x;
    }
};

struct OneMinus
{
    [[nodiscard]] constexpr double operator()(double x) const noexcept
    {
        return 1.0 - x;
    }
};

struct Invert
{
    [[nodiscard]] constexpr double operator()(double x) const noexcept
    {
        return 1.0 / x;
    }
};

struct Scale
{
    double factor;

    [[nodiscard]] constexpr double operator()(double x) const noexcept
    {
        return factor * x;
    }
};

struct Offset
{
    double amount;

    [[nodiscard]] constexpr double operator()(double x) const noexcept
    {
        return amount + x;
    }
};

#endif // SCALAR_OPS_HPP
