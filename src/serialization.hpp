#ifndef SERIALIZATION_HPP
#define SERIALIZATION_HPP

#include "matrix.hpp"
#include "network.hpp"

#include <filesystem>
#include <string>
#include <string_view>

// JSON form of a matrix: {"Cols":c,"Values":[...]} with the values in
// row-major order. Networks are stored as
// {"Layers":[...],"Weights":[matrix...],"Biases":[matrix...]}.
// Values are written with enough digits to be read back bit for bit.
// Every function throws serialization_error on failure.

[[nodiscard]] std::string matrix_to_json(const Matrix &matrix);
[[nodiscard]] Matrix matrix_from_json(std::string_view json);

[[nodiscard]] std::string network_to_json(const Network &network);
[[nodiscard]] Network network_from_json(std::string_view json);

void save_network(const Network &network, const std::filesystem::path &path);
[[nodiscard]] Network load_network(const std::filesystem::path &path);

#endif // SERIALIZATION_HPP
