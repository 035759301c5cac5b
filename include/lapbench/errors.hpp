#ifndef LAPBENCH_ERRORS_HPP
#define LAPBENCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lapbench {

/**
 * @brief Thrown when a LapTimer is constructed with a lap count below 1.
 */
class InvalidCapacity : public std::invalid_argument {
public:
    explicit InvalidCapacity(int count)
        : std::invalid_argument("must have count at least 1 (got " + std::to_string(count) + ")") {}
};

/**
 * @brief Thrown when results are read from a timer that has not been finalized yet.
 *
 * This is a usage error: the measurement loop was not driven until next() returned false.
 */
class IncompleteBenchmark : public std::logic_error {
public:
    IncompleteBenchmark() : std::logic_error("benchmarking incomplete") {}
};

} // namespace lapbench

#endif // LAPBENCH_ERRORS_HPP
