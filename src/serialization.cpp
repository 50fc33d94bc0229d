#include "serialization.hpp"
#include "errors.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace
{

void write_double(std::string &out, double value)
{
    if (!std::isfinite(value))
    {
        throw serialization_error("cannot store non-finite value " +
                                  std::to_string(value));
    }
    char buffer[32];
    const auto [end, ec] =
        std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc {})
    {
        throw serialization_error("cannot format value " +
                                  std::to_string(value));
    }
    out.append(buffer, end);
}

void write_matrix(std::string &out, const Matrix &matrix)
{
    out += "{\"Cols\":";
    out += std::to_string(matrix.cols());
    out += ",\"Values\":[";
    const auto values = matrix.values();
    for (std::size_t i {0}; i < values.size(); ++i)
    {
        if (i > 0)
        {
            out += ',';
        }
        write_double(out, values[i]);
    }
    out += "]}";
}

void write_matrices(std::string &out, const std::vector<Matrix> &matrices)
{
    out += '[';
    for (std::size_t i {0}; i < matrices.size(); ++i)
    {
        if (i > 0)
        {
            out += ',';
        }
        write_matrix(out, matrices[i]);
    }
    out += ']';
}

// Reader for the subset of JSON used by the stored files: objects with
// string keys, arrays and numbers.
class JsonReader
{
public:
    explicit JsonReader(std::string_view text) : m_text(text)
    {
    }

    template <typename OnKey>
    void read_object(OnKey &&on_key)
    {
        expect('{');
        std::set<std::string> seen;
        if (consume('}'))
        {
            return;
        }
        do
        {
            auto key = read_string();
            if (!seen.insert(key).second)
            {
                fail("duplicate key \"" + key + "\"");
            }
            expect(':');
            on_key(key);
        } while (consume(','));
        expect('}');
    }

    template <typename OnElement>
    void read_array(OnElement &&on_element)
    {
        expect('[');
        if (consume(']'))
        {
            return;
        }
        do
        {
            on_element();
        } while (consume(','));
        expect(']');
    }

    [[nodiscard]] double read_number()
    {
        skip_whitespace();
        const auto *first = m_text.data() + m_position;
        const auto *last = m_text.data() + m_text.size();
        if (first == last ||
            (*first != '-' && (*first < '0' || *first > '9')))
        {
            fail("expected a number");
        }
        double value {};
        const auto [end, ec] = std::from_chars(first, last, value);
        if (ec != std::errc {} || end == first || !std::isfinite(value))
        {
            fail("expected a number");
        }
        m_position += static_cast<std::size_t>(end - first);
        return value;
    }

    [[nodiscard]] int read_int()
    {
        const auto value = read_number();
        if (value != std::floor(value) || value < 0.0 ||
            value > static_cast<double>(std::numeric_limits<int>::max()))
        {
            fail("expected a non-negative integer");
        }
        return static_cast<int>(value);
    }

    void expect_end()
    {
        skip_whitespace();
        if (m_position != m_text.size())
        {
            fail("trailing characters");
        }
    }

    [[noreturn]] void fail(const std::string &message) const
    {
        throw serialization_error(message + " at offset " +
                                  std::to_string(m_position));
    }

private:
    void skip_whitespace() noexcept
    {
        while (m_position < m_text.size() &&
               (m_text[m_position] == ' ' || m_text[m_position] == '\t' ||
                m_text[m_position] == '\n' || m_text[m_position] == '\r'))
        {
            ++m_position;
        }
    }

    [[nodiscard]] bool consume(char c)
    {
        skip_whitespace();
        if (m_position < m_text.size() && m_text[m_position] == c)
        {
            ++m_position;
            return true;
        }
        return false;
    }

    void expect(char c)
    {
        if (!consume(c))
        {
            fail(std::string("expected '") + c + "'");
        }
    }

    [[nodiscard]] std::string read_string()
    {
        expect('"');
        std::string result;
        while (m_position < m_text.size() && m_text[m_position] != '"')
        {
            if (m_text[m_position] == '\\')
            {
                fail("escape sequences are not supported");
            }
            result += m_text[m_position++];
        }
        expect('"');
        return result;
    }

    std::string_view m_text;
    std::size_t m_position {0};
};

[[nodiscard]] Matrix read_matrix(JsonReader &reader)
{
    std::optional<int> cols;
    std::optional<std::vector<double>> values;

    reader.read_object(
        [&](const std::string &key)
        {
            if (key == "Cols")
            {
                cols = reader.read_int();
            }
            else if (key == "Values")
            {
                values.emplace();
                reader.read_array([&]
                                  { values->push_back(reader.read_number()); });
            }
            else
            {
                reader.fail("unknown matrix key \"" + key + "\"");
            }
        });

    if (!cols || !values)
    {
        reader.fail("matrix needs both \"Cols\" and \"Values\"");
    }
    try
    {
        return Matrix::from_values(*cols, *values);
    }
    catch (const shape_mismatch_error &e)
    {
        throw serialization_error(e.what());
    }
}

[[nodiscard]] std::vector<Matrix> read_matrices(JsonReader &reader)
{
    std::vector<Matrix> matrices;
    reader.read_array([&] { matrices.push_back(read_matrix(reader)); });
    return matrices;
}

} // namespace

std::string matrix_to_json(const Matrix &matrix)
{
    std::string out;
    write_matrix(out, matrix);
    return out;
}

Matrix matrix_from_json(std::string_view json)
{
    JsonReader reader(json);
    auto matrix = read_matrix(reader);
    reader.expect_end();
    return matrix;
}

std::string network_to_json(const Network &network)
{
    std::string out;
    out += "{\"Layers\":[";
    for (std::size_t i {0}; i < network.sizes.size(); ++i)
    {
        if (i > 0)
        {
            out += ',';
        }
        out += std::to_string(network.sizes[i]);
    }
    out += "],\"Weights\":";
    write_matrices(out, network.weights);
    out += ",\"Biases\":";
    write_matrices(out, network.biases);
    out += '}';
    return out;
}

Network network_from_json(std::string_view json)
{
    JsonReader reader(json);
    std::optional<std::vector<int>> sizes;
    std::optional<std::vector<Matrix>> weights;
    std::optional<std::vector<Matrix>> biases;

    reader.read_object(
        [&](const std::string &key)
        {
            if (key == "Layers")
            {
                sizes.emplace();
                reader.read_array([&] { sizes->push_back(reader.read_int()); });
            }
            else if (key == "Weights")
            {
                weights = read_matrices(reader);
            }
            else if (key == "Biases")
            {
                biases = read_matrices(reader);
            }
            else
            {
                reader.fail("unknown network key \"" + key + "\"");
            }
        });
    reader.expect_end();

    if (!sizes || !weights || !biases)
    {
        throw serialization_error(
            "network needs \"Layers\", \"Weights\" and \"Biases\"");
    }

    Network network {.sizes = std::move(*sizes),
                     .weights = std::move(*weights),
                     .biases = std::move(*biases)};
    if (!network_is_consistent(network))
    {
        throw serialization_error(
            "layer sizes do not match the weight and bias shapes");
    }
    return network;
}

void save_network(const Network &network, const std::filesystem::path &path)
{
    const auto json = network_to_json(network);
    std::ofstream file(path, std::ios::binary);
    if (!file)
    {
        throw serialization_error("could not open " + path.string() +
                                  " for writing");
    }
    file << json;
    if (!file)
    {
        throw serialization_error("could not write " + path.string());
    }
}

Network load_network(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw serialization_error("could not open " + path.string() +
                                  " for reading");
    }
    const std::string json {std::istreambuf_iterator<char>(file),
                            std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        throw serialization_error("could not read " + path.string());
    }
    return network_from_json(json);
}
