#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Operand dimensions incompatible with an elementwise or matrix product.
class shape_mismatch_error : public std::invalid_argument
{
public:
    explicit shape_mismatch_error(const std::string &message)
        : std::invalid_argument("Shape mismatch: " + message)
    {
    }
};

// Indexed access beyond the bounds of a matrix.
class out_of_range_error : public std::out_of_range
{
public:
    explicit out_of_range_error(const std::string &message)
        : std::out_of_range("Out of range: " + message)
    {
    }
};

// Extremum queried on a matrix without elements.
class empty_matrix_error : public std::logic_error
{
public:
    explicit empty_matrix_error(const std::string &message)
        : std::logic_error("Empty matrix: " + message)
    {
    }
};

// Malformed persisted data, or a failure to read or write it.
class serialization_error : public std::runtime_error
{
public:
    explicit serialization_error(const std::string &message)
        : std::runtime_error("Serialization: " + message)
    {
    }
};

#endif // ERRORS_HPP
