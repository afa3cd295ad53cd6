#include "centrality/CentralityMeasure.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace dissim {

    CentralityMeasure parseCentralityMeasure(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "degree") return CentralityMeasure::Degree;
        if (lower == "closeness") return CentralityMeasure::Closeness;
        if (lower == "betweenness") return CentralityMeasure::Betweenness;
        if (lower == "eigenvector") return CentralityMeasure::Eigenvector;
        if (lower == "spread") return CentralityMeasure::Spread;

        THROW_INVALID_PARAM("parseCentralityMeasure", "Unknown centrality measure: " + name +
                            ". Valid options are: degree, closeness, betweenness, eigenvector, spread");
    }

    std::string toString(CentralityMeasure measure) {
        switch (measure) {
            case CentralityMeasure::Degree:      return "degree";
            case CentralityMeasure::Closeness:   return "closeness";
            case CentralityMeasure::Betweenness: return "betweenness";
            case CentralityMeasure::Eigenvector: return "eigenvector";
            case CentralityMeasure::Spread:      return "spread";
        }
        return "unknown";
    }

    const std::vector<CentralityMeasure>& allCentralityMeasures() {
        static const std::vector<CentralityMeasure> measures = {
            CentralityMeasure::Degree,
            CentralityMeasure::Closeness,
            CentralityMeasure::Betweenness,
            CentralityMeasure::Eigenvector,
            CentralityMeasure::Spread
        };
        return measures;
    }

} // namespace dissim
