#ifndef NETWORK_HPP
#define NETWORK_HPP

#include "matrix.hpp"
#include "train_item.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

// Fully connected sigmoid network. weights[i] is sizes[i] x sizes[i + 1] and
// biases[i] is 1 x sizes[i + 1]. Copies are deep, so a copy can be kept as a
// snapshot while the original keeps training.
struct Network
{
    std::vector<int> sizes;
    std::vector<Matrix> weights;
    std::vector<Matrix> biases;
};

// Per-layer gradients, shaped like the network parameters.
struct Gradients
{
    std::vector<Matrix> weights;
    std::vector<Matrix> biases;
};

struct TrainingOptions
{
    // Number of epochs when positive. When negative, training keeps going
    // until the test cost has not improved for -epochs epochs in a row.
    int epochs {1};
    int mini_batch_size {10};
    double eta {0.5};
    // Allows halving eta while eta * eta_fraction exceeds the initial eta
    // before giving up on the best-of-N search. Zero disables decay.
    double eta_fraction {0.0};
    double lambda {0.0};
    bool print_cost {false};
};

struct EpochReport
{
    int epoch;
    std::optional<double> accuracy;
    std::optional<double> cost;
};

struct TrainingResult
{
    int epochs_run;
    double final_eta;
    // Cost of the retained snapshot, only for best-of-N training.
    std::optional<double> best_cost;
};

using EpochReporter = std::function<void(const EpochReport &)>;

[[nodiscard]] Network network_init(const std::vector<int> &sizes,
                                   std::minstd_rand &rng);

[[nodiscard]] bool network_is_consistent(const Network &network) noexcept;

[[nodiscard]] Matrix feed_forward(const Network &network, const Matrix &input);

// Mean cross-entropy (base 2) over the items.
[[nodiscard]] double cost(const Network &network,
                          const std::vector<TrainItem> &items);

// Fraction of items whose most activated output matches the label.
[[nodiscard]] double evaluate(const Network &network,
                              const std::vector<TrainItem> &items);

[[nodiscard]] Gradients backprop(const Network &network, const TrainItem &item);

void update_mini_batch(Network &network,
                       std::span<const TrainItem> batch,
                       double eta,
                       double lambda,
                       std::size_t training_set_size);

// round(items.size() / mini_batch_size) contiguous batches, the last one
// absorbing the remainder.
[[nodiscard]] std::vector<std::span<const TrainItem>>
make_mini_batches(std::span<const TrainItem> items, int mini_batch_size);

void validate_options(const TrainingOptions &options, bool has_test_items);

TrainingResult train(Network &network,
                     const std::vector<TrainItem> &items,
                     const std::vector<TrainItem> &test_items,
                     const TrainingOptions &options,
                     std::minstd_rand &rng,
                     const EpochReporter &reporter = {});

[[nodiscard]] std::string to_string(const Network &network);

std::ostream &operator<<(std::ostream &os, const Network &network);

#endif // NETWORK_HPP
