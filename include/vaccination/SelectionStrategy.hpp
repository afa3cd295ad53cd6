#ifndef SELECTION_STRATEGY_HPP
#define SELECTION_STRATEGY_HPP

#include <string>

namespace dissim {

    /**
     * @brief How vaccination candidates are ranked.
     */
    enum class SelectionStrategy {
        Batch,      ///< One ranking on the full graph; take the top k.
        Recursive   ///< Re-rank after every removal; take the best vertex each time.
    };

    /**
     * @brief Parses a strategy name (case-insensitive).
     * @throws InvalidParameterException If the name is not batch or recursive.
     */
    SelectionStrategy parseSelectionStrategy(const std::string& name);

    std::string toString(SelectionStrategy strategy);

} // namespace dissim

#endif // SELECTION_STRATEGY_HPP
