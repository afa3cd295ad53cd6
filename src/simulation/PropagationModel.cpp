#include "simulation/PropagationModel.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace dissim {

    PropagationModel parsePropagationModel(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "SIR") return PropagationModel::SIR;
        if (upper == "SIS") return PropagationModel::SIS;

        THROW_INVALID_PARAM("parsePropagationModel", "Unknown propagation model: " + name +
                            ". Valid options are: SIR, SIS");
    }

    std::string toString(PropagationModel model) {
        switch (model) {
            case PropagationModel::SIR: return "SIR";
            case PropagationModel::SIS: return "SIS";
        }
        return "unknown";
    }

} // namespace dissim
