#include "vaccination/SelectionStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace dissim {

    SelectionStrategy parseSelectionStrategy(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "batch") return SelectionStrategy::Batch;
        if (lower == "recursive") return SelectionStrategy::Recursive;

        THROW_INVALID_PARAM("parseSelectionStrategy", "Unknown selection strategy: " + name +
                            ". Valid options are: batch, recursive");
    }

    std::string toString(SelectionStrategy strategy) {
        switch (strategy) {
            case SelectionStrategy::Batch:     return "batch";
            case SelectionStrategy::Recursive: return "recursive";
        }
        return "unknown";
    }

} // namespace dissim
