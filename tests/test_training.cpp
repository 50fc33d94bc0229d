#include <gtest/gtest.h>

#include "network.hpp"

#include <algorithm>
#include <random>
#include <span>
#include <stdexcept>
#include <vector>

namespace
{

[[nodiscard]] std::vector<TrainItem> xor_items()
{
    return {make_train_item({0.0, 0.0}, 0.0, 2),
            make_train_item({0.0, 1.0}, 1.0, 2),
            make_train_item({1.0, 0.0}, 1.0, 2),
            make_train_item({1.0, 1.0}, 0.0, 2)};
}

// Same zero input labeled both ways: with the input at zero only the output
// biases move, each following b <- b - eta * (sigmoid(b) - 0.5) per epoch
// when the whole set is one mini-batch. For eta = 20 and |b| < 3.9 every
// step moves |b| further from zero, so the cost never improves on the
// initial one.
[[nodiscard]] std::vector<TrainItem> contradictory_items()
{
    return {make_train_item({0.0}, 0.0, 2),
            make_train_item({0.0}, 0.0, 2),
            make_train_item({0.0}, 1.0, 2),
            make_train_item({0.0}, 1.0, 2)};
}

// Same nonzero input labeled both ways: the cost converges towards two bits
// and then stalls.
[[nodiscard]] std::vector<TrainItem> constant_items()
{
    return {make_train_item({1.0}, 0.0, 2),
            make_train_item({1.0}, 0.0, 2),
            make_train_item({1.0}, 1.0, 2),
            make_train_item({1.0}, 1.0, 2)};
}

[[nodiscard]] Network bias_only_network()
{
    return Network {.sizes = {1, 2},
                    .weights = {Matrix::from_values(2, {0.4, -0.8})},
                    .biases = {Matrix::from_values(2, {0.3, -0.7})}};
}

[[nodiscard]] std::vector<std::size_t>
batch_sizes(const std::vector<std::span<const TrainItem>> &batches)
{
    std::vector<std::size_t> sizes;
    for (const auto &batch : batches)
    {
        sizes.push_back(batch.size());
    }
    return sizes;
}

[[nodiscard]] std::vector<TrainItem> numbered_items(int count)
{
    std::vector<TrainItem> items;
    for (int i {0}; i < count; ++i)
    {
        items.push_back(make_train_item({static_cast<double>(i)}, 0.0, 1));
    }
    return items;
}

} // namespace

TEST(MiniBatches, EvenSplit)
{
    const auto items = numbered_items(12);
    const auto batches = make_mini_batches(items, 4);
    EXPECT_EQ(batch_sizes(batches), (std::vector<std::size_t> {4, 4, 4}));
}

TEST(MiniBatches, RoundedUpCountLeavesShortLastBatch)
{
    const auto items = numbered_items(10);
    const auto batches = make_mini_batches(items, 4);
    EXPECT_EQ(batch_sizes(batches), (std::vector<std::size_t> {4, 4, 2}));
}

TEST(MiniBatches, RoundedDownCountLeavesLongLastBatch)
{
    const auto items = numbered_items(9);
    const auto batches = make_mini_batches(items, 4);
    EXPECT_EQ(batch_sizes(batches), (std::vector<std::size_t> {4, 5}));
}

TEST(MiniBatches, BatchesAreContiguousAndInOrder)
{
    const auto items = numbered_items(7);
    const auto batches = make_mini_batches(items, 3);
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].data(), items.data());
    EXPECT_EQ(batches[1].data(), items.data() + 3);
    EXPECT_EQ(batches[1].size(), 4u);
}

TEST(MiniBatches, CountRoundsHalfUp)
{
    EXPECT_EQ(batch_sizes(make_mini_batches(numbered_items(2), 4)),
              (std::vector<std::size_t> {2}));
    EXPECT_TRUE(make_mini_batches(numbered_items(1), 4).empty());
    EXPECT_TRUE(make_mini_batches({}, 4).empty());
}

TEST(Training, SetTooSmallForOneBatchLeavesNetworkUnchanged)
{
    std::minstd_rand rng(9);
    auto network = network_init({1, 2}, rng);
    const auto before = network;
    const auto items = numbered_items(1);

    const auto result = train(
        network, items, {}, {.epochs = 3, .mini_batch_size = 4}, rng);

    EXPECT_EQ(result.epochs_run, 3);
    EXPECT_EQ(network.weights, before.weights);
    EXPECT_EQ(network.biases, before.biases);
}

TEST(MiniBatches, RejectsNonPositiveSize)
{
    const auto items = numbered_items(3);
    EXPECT_THROW((void)make_mini_batches(items, 0), std::invalid_argument);
}

TEST(TrainingOptions, Validation)
{
    EXPECT_NO_THROW(validate_options({}, false));
    EXPECT_THROW(validate_options({.epochs = 0}, true), std::invalid_argument);
    EXPECT_THROW(validate_options({.epochs = 1, .mini_batch_size = 0}, true),
                 std::invalid_argument);
    EXPECT_THROW(validate_options({.epochs = 1, .eta = -0.1}, true),
                 std::invalid_argument);
    EXPECT_THROW(validate_options({.epochs = 1, .lambda = -1.0}, true),
                 std::invalid_argument);
    EXPECT_THROW(validate_options({.epochs = -3}, false),
                 std::invalid_argument);
    EXPECT_NO_THROW(validate_options({.epochs = -3}, true));
}

TEST(Training, FixedEpochsReportEveryEpoch)
{
    std::minstd_rand rng(5);
    auto network = network_init({2, 3, 2}, rng);
    const auto items = xor_items();

    std::vector<EpochReport> reports;
    const auto result = train(
        network,
        items,
        items,
        {.epochs = 7, .mini_batch_size = 2, .eta = 0.5, .print_cost = true},
        rng,
        [&](const EpochReport &report) { reports.push_back(report); });

    EXPECT_EQ(result.epochs_run, 7);
    EXPECT_EQ(result.final_eta, 0.5);
    EXPECT_FALSE(result.best_cost.has_value());
    ASSERT_EQ(reports.size(), 7u);
    for (int i {0}; i < 7; ++i)
    {
        EXPECT_EQ(reports[static_cast<std::size_t>(i)].epoch, i);
        ASSERT_TRUE(reports[static_cast<std::size_t>(i)].accuracy.has_value());
        EXPECT_TRUE(reports[static_cast<std::size_t>(i)].cost.has_value());
    }
    EXPECT_DOUBLE_EQ(*reports.back().accuracy, evaluate(network, items));
    EXPECT_DOUBLE_EQ(*reports.back().cost, cost(network, items));
}

TEST(Training, ReportsWithoutTestItemsCarryNoMetrics)
{
    std::minstd_rand rng(5);
    auto network = network_init({2, 3, 2}, rng);

    std::vector<EpochReport> reports;
    train(network,
          xor_items(),
          {},
          {.epochs = 3, .mini_batch_size = 4, .print_cost = true},
          rng,
          [&](const EpochReport &report) { reports.push_back(report); });

    ASSERT_EQ(reports.size(), 3u);
    for (const auto &report : reports)
    {
        EXPECT_FALSE(report.accuracy.has_value());
        EXPECT_FALSE(report.cost.has_value());
    }
}

TEST(Training, CostIsOnlyReportedWhenRequested)
{
    std::minstd_rand rng(5);
    auto network = network_init({2, 3, 2}, rng);
    const auto items = xor_items();

    std::vector<EpochReport> reports;
    train(network,
          items,
          items,
          {.epochs = 2, .mini_batch_size = 4},
          rng,
          [&](const EpochReport &report) { reports.push_back(report); });

    ASSERT_EQ(reports.size(), 2u);
    EXPECT_TRUE(reports[0].accuracy.has_value());
    EXPECT_FALSE(reports[0].cost.has_value());
}

TEST(Training, SameSeedSameNetwork)
{
    const auto items = xor_items();
    const TrainingOptions options {
        .epochs = 20, .mini_batch_size = 1, .eta = 1.0, .lambda = 0.1};

    std::minstd_rand first_rng(77);
    auto first = network_init({2, 3, 2}, first_rng);
    train(first, items, items, options, first_rng);

    std::minstd_rand second_rng(77);
    auto second = network_init({2, 3, 2}, second_rng);
    train(second, items, items, options, second_rng);

    EXPECT_EQ(first.weights, second.weights);
    EXPECT_EQ(first.biases, second.biases);
}

TEST(Training, LearnsXor)
{
    std::minstd_rand rng(2024);
    auto network = network_init({2, 8, 2}, rng);
    const auto items = xor_items();

    train(network,
          items,
          items,
          {.epochs = 4000, .mini_batch_size = 1, .eta = 1.0},
          rng);

    EXPECT_DOUBLE_EQ(evaluate(network, items), 1.0);
}

TEST(Training, BestOfNStopsAfterPatienceWithoutImprovement)
{
    std::minstd_rand rng(3);
    auto network = bias_only_network();
    const auto initial = network;
    const auto items = contradictory_items();
    const auto initial_cost = cost(network, items);

    std::vector<double> costs;
    const auto result = train(
        network,
        items,
        items,
        {.epochs = -5,
         .mini_batch_size = 4,
         .eta = 20.0,
         .eta_fraction = 0.0,
         .print_cost = true},
        rng,
        [&](const EpochReport &report) { costs.push_back(*report.cost); });

    EXPECT_EQ(result.epochs_run, 5);
    ASSERT_EQ(costs.size(), 5u);
    for (const auto c : costs)
    {
        EXPECT_GT(c, initial_cost);
    }

    // The retained parameters are the best snapshot, not the last epoch's.
    EXPECT_EQ(network.weights, initial.weights);
    EXPECT_EQ(network.biases, initial.biases);
    ASSERT_TRUE(result.best_cost.has_value());
    EXPECT_EQ(*result.best_cost, initial_cost);
    EXPECT_EQ(cost(network, items), initial_cost);
}

TEST(Training, BestOfNHalvesEtaBeforeGivingUp)
{
    std::minstd_rand rng(3);
    auto network = bias_only_network();
    const auto items = contradictory_items();

    std::vector<double> costs;
    const auto result = train(
        network,
        items,
        items,
        {.epochs = -3,
         .mini_batch_size = 4,
         .eta = 20.0,
         .eta_fraction = 8.0,
         .print_cost = true},
        rng,
        [&](const EpochReport &report) { costs.push_back(*report.cost); });

    // 20 -> 10 -> 5 -> 2.5, where 2.5 * 8 no longer exceeds the initial 20.
    EXPECT_EQ(result.final_eta, 2.5);
    EXPECT_GT(result.epochs_run, 3 * 4 - 1);
    ASSERT_EQ(costs.size(), static_cast<std::size_t>(result.epochs_run));
    ASSERT_TRUE(result.best_cost.has_value());
    EXPECT_EQ(cost(network, items), *result.best_cost);
    EXPECT_LE(*result.best_cost, *std::min_element(costs.begin(), costs.end()));
}

TEST(Training, BestOfNRetainsLowestCostSnapshot)
{
    std::minstd_rand rng(17);
    auto network = network_init({1, 2}, rng);
    const auto items = constant_items();
    const auto initial_cost = cost(network, items);

    std::vector<double> costs;
    const auto result = train(
        network,
        items,
        items,
        {.epochs = -5,
         .mini_batch_size = 4,
         .eta = 0.5,
         .eta_fraction = 0.0,
         .print_cost = true},
        rng,
        [&](const EpochReport &report) { costs.push_back(*report.cost); });

    ASSERT_FALSE(costs.empty());
    const auto best = std::min(initial_cost,
                               *std::min_element(costs.begin(), costs.end()));
    ASSERT_TRUE(result.best_cost.has_value());
    EXPECT_EQ(*result.best_cost, best);
    EXPECT_EQ(cost(network, items), best);

    // Training stops exactly five epochs after the last improvement.
    int last_improvement {-1};
    auto running_best = initial_cost;
    for (std::size_t i {0}; i < costs.size(); ++i)
    {
        if (costs[i] < running_best)
        {
            running_best = costs[i];
            last_improvement = static_cast<int>(i);
        }
    }
    EXPECT_EQ(result.epochs_run, last_improvement + 1 + 5);
}
