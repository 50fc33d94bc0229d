#include "network.hpp"
#include "serialization.hpp"

// NOTE: clipp uses std::result_of, but it is removed in C++20. GCC did not
// remove it yet, so just define it for MSVC.
#ifdef _MSC_VER
namespace std
{
template <class>
struct result_of;
template <class F, class... ArgTypes>
struct result_of<F(ArgTypes...)> : std::invoke_result<F, ArgTypes...>
{
};
} // namespace std
#endif
#include "clipp.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <cassert>
#include <cstdlib>

namespace
{

constexpr int xor_inputs {2};
constexpr int xor_classes {2};

struct Parameters
{
    std::string output_file_name;
    std::vector<int> hidden_sizes;
    TrainingOptions options;
    unsigned int seed;
};

[[nodiscard]] std::vector<TrainItem> xor_items()
{
    return {make_train_item({0.0, 0.0}, 0.0, xor_classes),
            make_train_item({0.0, 1.0}, 1.0, xor_classes),
            make_train_item({1.0, 0.0}, 1.0, xor_classes),
            make_train_item({1.0, 1.0}, 0.0, xor_classes)};
}

void print_report(const EpochReport &report)
{
    if (!report.accuracy)
    {
        std::cout << "Epoch " << report.epoch << " finished.\n";
        return;
    }
    std::cout << "Epoch " << report.epoch << ": " << *report.accuracy << '\n';
    if (report.cost)
    {
        std::cout << "Cost: " << *report.cost << '\n';
    }
}

void print_error(const clipp::parsing_result &result,
                 const std::vector<std::string> &unmatched,
                 const clipp::group &cli,
                 const std::string &executable_name)
{
    if (!unmatched.empty())
    {
        std::cerr << "Unmatched extra arguments:";
        for (const auto &arg : unmatched)
        {
            std::cerr << " \"" << arg << '\"';
        }
        std::cerr << '\n';
    }

    for (const auto &arg : result.missing())
    {
        if (!arg.param()->label().empty())
        {
            std::cerr << "Missing parameter \"" << arg.param()->label()
                      << "\" after index " << arg.after_index() << '\n';
        }
    }

    for (const auto &arg : result)
    {
        if (arg.any_error())
        {
            std::cerr << "Error at argument " << arg.index() << " \""
                      << arg.arg() << "\"\n";
        }
    }

    std::cerr << "Usage:\n" << clipp::usage_lines(cli, executable_name) << '\n';
}

[[nodiscard]] Parameters parse_command_line(int argc, char *argv[])
{
    Parameters params {.output_file_name = {},
                       .hidden_sizes = {},
                       .options = {.epochs = -50,
                                   .mini_batch_size = 1,
                                   .eta = 2.0,
                                   .eta_fraction = 8.0,
                                   .lambda = 0.0,
                                   .print_cost = false},
                       .seed = 42};

    bool show_help {false};
    std::vector<std::string> unmatched;

    const auto cli =
        (clipp::option("-h", "--help")
             .set(show_help)
             .doc("Show this message and exit") |
         ((clipp::option("-o", "--output") &
           clipp::value(clipp::match::prefix_not("-"),
                        "output",
                        params.output_file_name))
              .doc("Save the trained network to this JSON file"),
          (clipp::option("-a", "--arch") &
           clipp::values(
               clipp::match::integers(), "hidden_sizes", params.hidden_sizes))
              .doc("Sizes of the hidden layers (default: 4)"),
          (clipp::option("-e", "--epochs") &
           clipp::value(
               clipp::match::integers(), "epochs", params.options.epochs))
              .doc("Number of training epochs, or when negative the number "
                   "of epochs without improvement before giving up "
                   "(default: " +
                   std::to_string(params.options.epochs) + ")"),
          (clipp::option("-b", "--batch-size") &
           clipp::value(clipp::match::integers(),
                        "batch_size",
                        params.options.mini_batch_size))
              .doc("Mini-batch size (default: " +
                   std::to_string(params.options.mini_batch_size) + ")"),
          (clipp::option("-l", "--learning-rate") &
           clipp::value(
               clipp::match::numbers(), "learning_rate", params.options.eta))
              .doc("Learning rate (default: " +
                   std::to_string(params.options.eta) + ")"),
          (clipp::option("-f", "--eta-fraction") &
           clipp::value(clipp::match::numbers(),
                        "eta_fraction",
                        params.options.eta_fraction))
              .doc("Halve the learning rate while it stays above the "
                   "initial one divided by this fraction, 0 to disable "
                   "(default: " +
                   std::to_string(params.options.eta_fraction) + ")"),
          (clipp::option("-r", "--regularization") &
           clipp::value(
               clipp::match::numbers(), "lambda", params.options.lambda))
              .doc("L2 regularization strength (default: " +
                   std::to_string(params.options.lambda) + ")"),
          (clipp::option("-s", "--seed") &
           clipp::value(clipp::match::integers(), "seed", params.seed))
              .doc("Seed of the random number generator (default: " +
                   std::to_string(params.seed) + ")"),
          clipp::option("-c", "--cost")
              .set(params.options.print_cost)
              .doc("Report the test cost after each epoch"),
          clipp::any_other(unmatched)));

    assert(cli.flags_are_prefix_free());
    assert(cli.common_flag_prefix() == "-");

    const auto result = clipp::parse(argc, argv, cli);

    if (result.any_error() || !unmatched.empty())
    {
        print_error(result,
                    unmatched,
                    cli,
                    std::filesystem::path(argv[0]).filename().string());
        std::exit(EXIT_FAILURE);
    }

    if (show_help)
    {
        std::cout << clipp::make_man_page(
                         cli,
                         std::filesystem::path(argv[0]).filename().string())
                  << '\n';
        std::exit(EXIT_SUCCESS);
    }

    if (params.hidden_sizes.empty())
    {
        params.hidden_sizes.push_back(4);
    }
    for (const auto size : params.hidden_sizes)
    {
        if (size <= 0)
        {
            std::cerr << "Error on layer size of " << size
                      << ": must be strictly positive\n";
            std::exit(EXIT_FAILURE);
        }
    }

    return params;
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto params = parse_command_line(argc, argv);

        std::vector<int> layer_sizes {xor_inputs};
        layer_sizes.insert(layer_sizes.end(),
                           params.hidden_sizes.begin(),
                           params.hidden_sizes.end());
        layer_sizes.push_back(xor_classes);

        std::cout << "Network layout:";
        for (const auto size : layer_sizes)
        {
            std::cout << ' ' << size;
        }
        std::cout << '\n';
        if (params.options.epochs < 0)
        {
            std::cout << "Patience: " << -params.options.epochs
                      << " epochs\n";
        }
        else
        {
            std::cout << "Epochs: " << params.options.epochs << '\n';
        }
        std::cout << "Mini-batch size: " << params.options.mini_batch_size
                  << '\n'
                  << "Learning rate: " << params.options.eta << '\n'
                  << "Seed: " << params.seed << '\n'
                  << std::string(72, '-') << '\n';

        std::minstd_rand rng(params.seed);
        const auto items = xor_items();
        auto network = network_init(layer_sizes, rng);

        const auto result =
            train(network, items, items, params.options, rng, print_report);

        std::cout << std::string(72, '-') << '\n'
                  << "Trained for " << result.epochs_run << " epochs, final "
                  << "learning rate " << result.final_eta << '\n';
        if (result.best_cost)
        {
            std::cout << "Best cost: " << *result.best_cost << '\n';
        }
        std::cout << "Accuracy: " << evaluate(network, items) << '\n';

        for (const auto &item : items)
        {
            const auto output = feed_forward(network, item.values);
            std::cout << item.values << " -> " << output.max_index() << '\n';
        }

        if (!params.output_file_name.empty())
        {
            std::cout << "Saving network to "
                      << std::quoted(params.output_file_name) << '\n';
            save_network(network, params.output_file_name);
        }

        return EXIT_SUCCESS;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "Unknown exception thrown\n";
        return EXIT_FAILURE;
    }
}
