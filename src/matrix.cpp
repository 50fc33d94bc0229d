#include "matrix.hpp"
#include "errors.hpp"
#include "scalar_ops.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace
{

[[nodiscard]] std::string shape_string(int rows, int cols)
{
    return std::to_string(rows) + " x " + std::to_string(cols);
}

// Number of digits before the decimal point, minus one. Zero for infinities
// and NaN.
[[nodiscard]] int integer_digits(double value) noexcept
{
    if (!std::isfinite(value))
    {
        return 0;
    }
    int digits {0};
    while (value >= 10.0)
    {
        value /= 10.0;
        ++digits;
    }
    return digits;
}

} // namespace

Matrix::Matrix(int rows, int cols)
{
    if (rows < 0 || cols < 0)
    {
        throw std::invalid_argument("Invalid matrix dimensions " +
                                    shape_string(rows, cols));
    }
    m_values.setZero(rows, cols);
}

Matrix Matrix::from_values(int cols, const std::vector<double> &values)
{
    if (cols < 0 || (cols == 0 && !values.empty()) ||
        (cols > 0 && values.size() % static_cast<std::size_t>(cols) != 0))
    {
        throw shape_mismatch_error(std::to_string(values.size()) +
                                   " values cannot fill rows of " +
                                   std::to_string(cols) + " columns");
    }
    const auto rows =
        cols == 0 ? 0 : static_cast<Eigen::Index>(values.size()) / cols;
    return Matrix(
        Storage(Eigen::Map<const Storage>(values.data(), rows, cols)));
}

Matrix::Matrix(Storage values) : m_values(std::move(values))
{
}

Matrix Matrix::random(int rows, int cols, std::minstd_rand &rng)
{
    Matrix result(rows, cols);
    std::normal_distribution<double> distribution(0.0, 1.0);
    const auto generate = [&](double) { return distribution(rng); };
    result.m_values = result.m_values.unaryExpr(generate);
    return result;
}

Matrix Matrix::random_normalized(int rows, int cols, std::minstd_rand &rng)
{
    const auto scale = 1.0 / std::sqrt(static_cast<double>(rows));
    return random(rows, cols, rng).apply(Scale {scale});
}

Matrix Matrix::one_hot(int rows, int cols, int row, int col)
{
    Matrix result(rows, cols);
    result.set(row, col, 1.0);
    return result;
}

double Matrix::at(int row, int col) const
{
    if (row < 0 || row >= rows() || col < 0 || col >= cols())
    {
        throw out_of_range_error("cannot get (" + std::to_string(row) + ", " +
                                 std::to_string(col) + ") of a " +
                                 shape_string(rows(), cols()) + " matrix");
    }
    return m_values(row, col);
}

void Matrix::set(int row, int col, double value)
{
    if (row < 0 || row >= rows() || col < 0 || col >= cols())
    {
        throw out_of_range_error("cannot set (" + std::to_string(row) + ", " +
                                 std::to_string(col) + ") of a " +
                                 shape_string(rows(), cols()) + " matrix");
    }
    m_values(row, col) = value;
}

void Matrix::check_same_shape(const Matrix &other, const char *operation) const
{
    if (rows() != other.rows() || cols() != other.cols())
    {
        throw shape_mismatch_error(std::string(operation) + " of " +
                                   shape_string(rows(), cols()) + " and " +
                                   shape_string(other.rows(), other.cols()));
    }
}

Matrix Matrix::add(const Matrix &other) const
{
    check_same_shape(other, "add");
    return Matrix(Storage(m_values + other.m_values));
}

Matrix Matrix::subtract(const Matrix &other) const
{
    check_same_shape(other, "subtract");
    return Matrix(Storage(m_values - other.m_values));
}

Matrix Matrix::elementwise_multiply(const Matrix &other) const
{
    check_same_shape(other, "elementwise multiply");
    return Matrix(Storage(m_values.cwiseProduct(other.m_values)));
}

Matrix Matrix::dot(const Matrix &other) const
{
    if (cols() != other.rows())
    {
        throw shape_mismatch_error(
            "dot of " + shape_string(rows(), cols()) + " and " +
            shape_string(other.rows(), other.cols()) +
            " requires left columns == right rows");
    }
    Storage result(rows(), other.cols());
    result.noalias() = m_values * other.m_values;
    return Matrix(std::move(result));
}

Matrix Matrix::transpose() const
{
    return Matrix(Storage(m_values.transpose()));
}

double Matrix::sum() const noexcept
{
    return m_values.sum();
}

int Matrix::max_index() const
{
    if (size() == 0)
    {
        throw empty_matrix_error("cannot find the maximum of a " +
                                 shape_string(rows(), cols()) + " matrix");
    }
    const auto *data = m_values.data();
    int index {0};
    for (int i {1}; i < size(); ++i)
    {
        if (data[i] > data[index])
        {
            index = i;
        }
    }
    return index;
}

int Matrix::min_index() const
{
    if (size() == 0)
    {
        throw empty_matrix_error("cannot find the minimum of a " +
                                 shape_string(rows(), cols()) + " matrix");
    }
    const auto *data = m_values.data();
    int index {0};
    for (int i {1}; i < size(); ++i)
    {
        if (data[i] < data[index])
        {
            index = i;
        }
    }
    return index;
}

double Matrix::max_value() const
{
    return m_values.data()[max_index()];
}

double Matrix::min_value() const
{
    return m_values.data()[min_index()];
}

Matrix Matrix::sigmoid() const
{
    return apply(Negate {}).apply(Exp {}).apply(OnePlus {}).apply(Invert {});
}

Matrix Matrix::sigmoid_prime() const
{
    const auto s = sigmoid();
    return s.elementwise_multiply(s.apply(OneMinus {}));
}

std::vector<double> Matrix::values() const
{
    return {m_values.data(), m_values.data() + m_values.size()};
}

std::string Matrix::to_string() const
{
    if (size() == 0)
    {
        return {};
    }

    const auto width = integer_digits(max_value()) + 6;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    for (int i {0}; i < rows(); ++i)
    {
        if (i > 0)
        {
            oss << '\n';
        }
        oss << "| ";
        for (int j {0}; j < cols(); ++j)
        {
            oss << std::setw(width) << m_values(i, j);
        }
        oss << " |";
    }
    return oss.str();
}

bool operator==(const Matrix &lhs, const Matrix &rhs)
{
    return lhs.rows() == rhs.rows() && lhs.cols() == rhs.cols() &&
           lhs.m_values == rhs.m_values;
}

std::ostream &operator<<(std::ostream &os, const Matrix &matrix)
{
    return os << matrix.to_string();
}
