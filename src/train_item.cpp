#include "train_item.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

TrainItem make_train_item(const std::vector<double> &values,
                          double label,
                          int distinct)
{
    if (distinct <= 0)
    {
        throw std::invalid_argument("Error on number of classes of " +
                                    std::to_string(distinct) +
                                    ": must be strictly positive");
    }
    if (!std::isfinite(label) || label != std::floor(label) || label < 0.0 ||
        label >= static_cast<double>(distinct))
    {
        throw std::invalid_argument("Error on label of " +
                                    std::to_string(label) +
                                    ": must be a class index below " +
                                    std::to_string(distinct));
    }
    return TrainItem {.values = Matrix::from_values(
                          static_cast<int>(values.size()), values),
                      .label = label,
                      .distinct = distinct};
}

Matrix one_hot_target(const TrainItem &item)
{
    return Matrix::one_hot(1, item.distinct, 0, static_cast<int>(item.label));
}
