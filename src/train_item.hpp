#ifndef TRAIN_ITEM_HPP
#define TRAIN_ITEM_HPP

#include "matrix.hpp"

#include <vector>

// A labeled example. The label is the index of the expected output neuron,
// stored as a double so that it compares exactly with a converted index.
struct TrainItem
{
    Matrix values;
    double label;
    int distinct;
};

// Throws std::invalid_argument unless label is an integer in [0, distinct).
[[nodiscard]] TrainItem make_train_item(const std::vector<double> &values,
                                        double label,
                                        int distinct);

// 1 x distinct matrix with a single one at the label position.
[[nodiscard]] Matrix one_hot_target(const TrainItem &item);

#endif // TRAIN_ITEM_HPP
