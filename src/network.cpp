#include "network.hpp"
#include "scalar_ops.hpp"

#include <algorithm>
#include <cassert>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace
{

struct ForwardTrace
{
    std::vector<Matrix> zs;
    std::vector<Matrix> activations;
};

[[nodiscard]] inline Matrix layer_predict(const Matrix &weights,
                                          const Matrix &biases,
                                          const Matrix &input)
{
    return input.dot(weights).add(biases);
}

[[nodiscard]] ForwardTrace forward_trace(const Network &network,
                                         const Matrix &input)
{
    ForwardTrace trace;
    trace.zs.reserve(network.weights.size());
    trace.activations.reserve(network.weights.size() + 1);
    trace.activations.push_back(input);

    for (std::size_t i {0}; i < network.weights.size(); ++i)
    {
        trace.zs.push_back(layer_predict(
            network.weights[i], network.biases[i], trace.activations.back()));
        trace.activations.push_back(trace.zs.back().sigmoid());
    }

    return trace;
}

[[nodiscard]] Gradients zero_gradients(const Network &network)
{
    Gradients gradients;
    gradients.weights.reserve(network.weights.size());
    gradients.biases.reserve(network.biases.size());
    for (const auto &w : network.weights)
    {
        gradients.weights.emplace_back(w.rows(), w.cols());
    }
    for (const auto &b : network.biases)
    {
        gradients.biases.emplace_back(b.rows(), b.cols());
    }
    return gradients;
}

inline void accumulate(std::vector<Matrix> &sums,
                       const std::vector<Matrix> &terms)
{
    assert(sums.size() == terms.size());
    for (std::size_t i {0}; i < sums.size(); ++i)
    {
        sums[i] = sums[i].add(terms[i]);
    }
}

[[nodiscard]] std::vector<TrainItem>
shuffled_copy(const std::vector<TrainItem> &items, std::minstd_rand &rng)
{
    std::vector<TrainItem> shuffled(items);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    return shuffled;
}

} // namespace

Network network_init(const std::vector<int> &sizes, std::minstd_rand &rng)
{
    if (sizes.size() < 2)
    {
        throw std::invalid_argument(
            "A network needs at least an input and an output layer");
    }
    for (const auto size : sizes)
    {
        if (size <= 0)
        {
            throw std::invalid_argument("Error on layer size of " +
                                        std::to_string(size) +
                                        ": must be strictly positive");
        }
    }

    Network network {.sizes = sizes, .weights = {}, .biases = {}};
    network.weights.reserve(sizes.size() - 1);
    network.biases.reserve(sizes.size() - 1);

    for (std::size_t i {0}; i < sizes.size() - 1; ++i)
    {
        network.biases.push_back(Matrix::random(1, sizes[i + 1], rng));
    }
    for (std::size_t i {0}; i < sizes.size() - 1; ++i)
    {
        network.weights.push_back(
            Matrix::random_normalized(sizes[i], sizes[i + 1], rng));
    }

    return network;
}

bool network_is_consistent(const Network &network) noexcept
{
    if (network.sizes.size() < 2 ||
        network.weights.size() != network.sizes.size() - 1 ||
        network.biases.size() != network.sizes.size() - 1)
    {
        return false;
    }
    for (std::size_t i {0}; i < network.weights.size(); ++i)
    {
        const auto &w = network.weights[i];
        const auto &b = network.biases[i];
        if (network.sizes[i] <= 0 || w.rows() != network.sizes[i] ||
            w.cols() != network.sizes[i + 1] || b.rows() != 1 ||
            b.cols() != network.sizes[i + 1])
        {
            return false;
        }
    }
    return true;
}

Matrix feed_forward(const Network &network, const Matrix &input)
{
    assert(network_is_consistent(network));
    assert(input.rows() == 1 && input.cols() == network.sizes.front());

    auto activation = input;
    for (std::size_t i {0}; i < network.weights.size(); ++i)
    {
        activation =
            layer_predict(network.weights[i], network.biases[i], activation)
                .sigmoid();
    }
    return activation;
}

double cost(const Network &network, const std::vector<TrainItem> &items)
{
    if (items.empty())
    {
        return 0.0;
    }

    double total {0.0};
    for (const auto &item : items)
    {
        const auto output = feed_forward(network, item.values);
        const auto y = one_hot_target(item);
        const auto first =
            y.apply(Negate {}).elementwise_multiply(output.apply(Log2 {}));
        const auto second = y.apply(OneMinus {}).elementwise_multiply(
            output.apply(OneMinus {}).apply(Log2 {}));
        total += first.subtract(second).sum();
    }
    return total / static_cast<double>(items.size());
}

double evaluate(const Network &network, const std::vector<TrainItem> &items)
{
    if (items.empty())
    {
        return 0.0;
    }

    std::size_t correct {0};
    for (const auto &item : items)
    {
        const auto output = feed_forward(network, item.values);
        if (static_cast<double>(output.max_index()) == item.label)
        {
            ++correct;
        }
    }
    return static_cast<double>(correct) / static_cast<double>(items.size());
}

Gradients backprop(const Network &network, const TrainItem &item)
{
    assert(network_is_consistent(network));

    const auto trace = forward_trace(network, item.values);
    const auto &zs = trace.zs;
    const auto &activations = trace.activations;
    const auto last = network.weights.size() - 1;

    auto gradients = zero_gradients(network);

    // With sigmoid outputs and cross-entropy cost, the sigmoid derivative
    // cancels out of the output error.
    auto delta = activations.back().subtract(one_hot_target(item));
    gradients.biases[last] = delta;
    gradients.weights[last] = activations[last].transpose().dot(delta);

    for (std::size_t l {last}; l > 0; --l)
    {
        delta = delta.dot(network.weights[l].transpose())
                    .elementwise_multiply(zs[l - 1].sigmoid_prime());
        gradients.biases[l - 1] = delta;
        gradients.weights[l - 1] = activations[l - 1].transpose().dot(delta);
    }

    return gradients;
}

void update_mini_batch(Network &network,
                       std::span<const TrainItem> batch,
                       double eta,
                       double lambda,
                       std::size_t training_set_size)
{
    if (batch.empty())
    {
        return;
    }
    if (training_set_size < batch.size())
    {
        throw std::invalid_argument(
            "Training set size of " + std::to_string(training_set_size) +
            " is smaller than the mini-batch size of " +
            std::to_string(batch.size()));
    }

    auto sums = zero_gradients(network);
    for (const auto &item : batch)
    {
        const auto gradients = backprop(network, item);
        accumulate(sums.weights, gradients.weights);
        accumulate(sums.biases, gradients.biases);
    }

    const Scale step {eta / static_cast<double>(batch.size())};
    const Scale decay {1.0 - eta * lambda /
                                 static_cast<double>(training_set_size)};

    for (std::size_t i {0}; i < network.weights.size(); ++i)
    {
        network.weights[i] = network.weights[i].apply(decay).subtract(
            sums.weights[i].apply(step));
    }
    for (std::size_t i {0}; i < network.biases.size(); ++i)
    {
        network.biases[i] =
            network.biases[i].subtract(sums.biases[i].apply(step));
    }
}

std::vector<std::span<const TrainItem>>
make_mini_batches(std::span<const TrainItem> items, int mini_batch_size)
{
    if (mini_batch_size <= 0)
    {
        throw std::invalid_argument("Error on mini-batch size of " +
                                    std::to_string(mini_batch_size) +
                                    ": must be strictly positive");
    }

    const auto size = static_cast<std::size_t>(mini_batch_size);
    // Rounded half up: fewer than size / 2 items make no batch at all.
    const auto count = static_cast<std::size_t>(
        static_cast<double>(items.size()) / static_cast<double>(size) + 0.5);

    std::vector<std::span<const TrainItem>> batches;
    batches.reserve(count);
    for (std::size_t i {0}; i < count; ++i)
    {
        const auto begin = i * size;
        if (i + 1 == count)
        {
            batches.push_back(items.subspan(begin));
        }
        else
        {
            batches.push_back(items.subspan(begin, size));
        }
    }
    return batches;
}

void validate_options(const TrainingOptions &options, bool has_test_items)
{
    if (options.epochs == 0)
    {
        throw std::invalid_argument(
            "Error on number of epochs of 0: must be non-zero");
    }
    if (options.mini_batch_size <= 0)
    {
        throw std::invalid_argument("Error on mini-batch size of " +
                                    std::to_string(options.mini_batch_size) +
                                    ": must be strictly positive");
    }
    if (options.eta < 0.0)
    {
        throw std::invalid_argument("Error on learning rate of " +
                                    std::to_string(options.eta) +
                                    ": must be positive");
    }
    if (options.lambda < 0.0)
    {
        throw std::invalid_argument("Error on regularization of " +
                                    std::to_string(options.lambda) +
                                    ": must be positive");
    }
    if (options.epochs < 0 && !has_test_items)
    {
        throw std::invalid_argument(
            "Best-of-N training needs test items to measure the cost");
    }
}

TrainingResult train(Network &network,
                     const std::vector<TrainItem> &items,
                     const std::vector<TrainItem> &test_items,
                     const TrainingOptions &options,
                     std::minstd_rand &rng,
                     const EpochReporter &reporter)
{
    validate_options(options, !test_items.empty());

    const bool best_of_n {options.epochs < 0};
    const int epochs {best_of_n ? -options.epochs : options.epochs};
    const double initial_eta {options.eta};
    double eta {options.eta};

    std::optional<Network> best_network;
    double best_cost {0.0};
    int epochs_since_best {0};
    if (best_of_n)
    {
        best_cost = cost(network, test_items);
        best_network = network;
    }

    int epoch {0};
    for (;;)
    {
        if (!best_of_n && epoch >= epochs)
        {
            break;
        }
        if (best_of_n && epochs_since_best >= epochs)
        {
            // Compared against the initial eta, not the current one.
            if (options.eta_fraction > 0.0 &&
                eta * options.eta_fraction > initial_eta)
            {
                epochs_since_best = 0;
                eta /= 2.0;
            }
            else
            {
                network = std::move(*best_network);
                break;
            }
        }

        const auto shuffled = shuffled_copy(items, rng);
        const auto batches =
            make_mini_batches(shuffled, options.mini_batch_size);
        for (const auto batch : batches)
        {
            update_mini_batch(
                network, batch, eta, options.lambda, items.size());
        }

        EpochReport report {.epoch = epoch, .accuracy = {}, .cost = {}};
        if (!test_items.empty())
        {
            const auto epoch_cost = cost(network, test_items);
            if (best_of_n)
            {
                if (epoch_cost < best_cost)
                {
                    best_cost = epoch_cost;
                    best_network = network;
                    epochs_since_best = 0;
                }
                else
                {
                    ++epochs_since_best;
                }
            }
            report.accuracy = evaluate(network, test_items);
            if (options.print_cost)
            {
                report.cost = epoch_cost;
            }
        }
        if (reporter)
        {
            reporter(report);
        }

        ++epoch;
    }

    TrainingResult result {
        .epochs_run = epoch, .final_eta = eta, .best_cost = {}};
    if (best_of_n)
    {
        result.best_cost = best_cost;
    }
    return result;
}

std::string to_string(const Network &network)
{
    std::ostringstream oss;
    oss << "Neural network:\nlayers:";
    for (const auto size : network.sizes)
    {
        oss << ' ' << size;
    }
    for (std::size_t i {0}; i < network.weights.size(); ++i)
    {
        oss << "\nweights layer " << i << " to " << i + 1 << ":\n"
            << network.weights[i];
    }
    for (std::size_t i {0}; i < network.biases.size(); ++i)
    {
        oss << "\nbiases layer " << i + 1 << ":\n" << network.biases[i];
    }
    return oss.str();
}

std::ostream &operator<<(std::ostream &os, const Network &network)
{
    return os << to_string(network);
}
