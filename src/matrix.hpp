#ifndef MATRIX_HPP
#define MATRIX_HPP

#include <Eigen/Core>

#include <iosfwd>
#include <random>
#include <string>
#include <vector>

// Dense row-major matrix of doubles with value semantics: copies own their
// storage and every operation except set() returns a new matrix.
class Matrix
{
public:
    using Storage =
        Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    Matrix() = default;

    // Zero-filled matrix.
    Matrix(int rows, int cols);

    // Entries drawn from the standard normal distribution.
    [[nodiscard]] static Matrix
    random(int rows, int cols, std::minstd_rand &rng);

    // Same as random(), divided by sqrt(rows) so that the variance of a
    // product with this matrix does not grow with the fan-in.
    [[nodiscard]] static Matrix
    random_normalized(int rows, int cols, std::minstd_rand &rng);

    // Wraps a flat row-major sequence, the number of rows being
    // values.size() / cols.
    [[nodiscard]] static Matrix from_values(int cols,
                                            const std::vector<double> &values);

    [[nodiscard]] static Matrix one_hot(int rows, int cols, int row, int col);

    [[nodiscard]] int rows() const noexcept
    {
        return static_cast<int>(m_values.rows());
    }

    [[nodiscard]] int cols() const noexcept
    {
        return static_cast<int>(m_values.cols());
    }

    [[nodiscard]] int size() const noexcept
    {
        return static_cast<int>(m_values.size());
    }

    [[nodiscard]] double at(int row, int col) const;
    void set(int row, int col, double value);

    [[nodiscard]] Matrix add(const Matrix &other) const;
    [[nodiscard]] Matrix subtract(const Matrix &other) const;
    [[nodiscard]] Matrix elementwise_multiply(const Matrix &other) const;
    [[nodiscard]] Matrix dot(const Matrix &other) const;
    [[nodiscard]] Matrix transpose() const;
    [[nodiscard]] double sum() const noexcept;

    template <typename UnaryOp>
    [[nodiscard]] Matrix apply(const UnaryOp &op) const
    {
        return Matrix(Storage(m_values.unaryExpr(op)));
    }

    // Flat row-major position of the first occurrence of the extremum.
    [[nodiscard]] int max_index() const;
    [[nodiscard]] int min_index() const;
    [[nodiscard]] double max_value() const;
    [[nodiscard]] double min_value() const;

    [[nodiscard]] Matrix sigmoid() const;
    [[nodiscard]] Matrix sigmoid_prime() const;

    // Flat row-major copy of the elements.
    [[nodiscard]] std::vector<double> values() const;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Matrix &lhs, const Matrix &rhs);

private:
    explicit Matrix(Storage values);

    void check_same_shape(const Matrix &other, const char *operation) const;

    Storage m_values;
};

std::ostream &operator<<(std::ostream &os, const Matrix &matrix);

#endif // MATRIX_HPP
