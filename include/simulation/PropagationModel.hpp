#ifndef PROPAGATION_MODEL_HPP
#define PROPAGATION_MODEL_HPP

#include <string>

namespace dissim {

    /**
     * @brief Rule applied when an infected vertex stops being infected.
     */
    enum class PropagationModel {
        SIR,  ///< Recovered is terminal; the vertex can never be reinfected.
        SIS   ///< The vertex returns to Susceptible and can be reinfected.
    };

    /**
     * @brief Parses a model name (case-insensitive).
     * @throws InvalidParameterException If the name is not SIR or SIS.
     */
    PropagationModel parsePropagationModel(const std::string& name);

    std::string toString(PropagationModel model);

} // namespace dissim

#endif // PROPAGATION_MODEL_HPP
