#ifndef HEALTH_STATE_HPP
#define HEALTH_STATE_HPP

#include <string>

namespace dissim {

    /**
     * @brief Health state of one vertex during a trial.
     */
    enum class HealthState {
        Susceptible,
        Infected,
        Recovered
    };

    inline std::string toString(HealthState state) {
        switch (state) {
            case HealthState::Susceptible: return "susceptible";
            case HealthState::Infected:    return "infected";
            case HealthState::Recovered:   return "recovered";
        }
        return "unknown";
    }

} // namespace dissim

#endif // HEALTH_STATE_HPP
