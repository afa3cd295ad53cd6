#include "simulation/RecoveryRule.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace dissim {

    RecoveryRule parseRecoveryRule(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "bernoulli") return RecoveryRule::Bernoulli;
        if (lower == "normal")    return RecoveryRule::Normal;
        if (lower == "uniform")   return RecoveryRule::Uniform;

        THROW_INVALID_PARAM("parseRecoveryRule", "Unknown recovery rule: " + name +
                            ". Valid options are: bernoulli, normal, uniform");
    }

    std::string toString(RecoveryRule rule) {
        switch (rule) {
            case RecoveryRule::Bernoulli: return "bernoulli";
            case RecoveryRule::Normal:    return "normal";
            case RecoveryRule::Uniform:   return "uniform";
        }
        return "unknown";
    }

    void RecoveryParameters::validate() const {
        if (!(pd >= 0.0 && pd <= 1.0)) {
            THROW_INVALID_PARAM("RecoveryParameters::validate", "Recovery probability pd must be in [0, 1]. Got: " + std::to_string(pd));
        }
        switch (rule) {
            case RecoveryRule::Bernoulli:
                break;
            case RecoveryRule::Normal:
                if (!std::isfinite(mu)) {
                    THROW_INVALID_PARAM("RecoveryParameters::validate", "Recovery time mean mu must be finite.");
                }
                if (!(sigma > 0.0) || !std::isfinite(sigma)) {
                    THROW_INVALID_PARAM("RecoveryParameters::validate", "Recovery time deviation sigma must be positive. Got: " + std::to_string(sigma));
                }
                break;
            case RecoveryRule::Uniform:
                if (min_t < 1) {
                    THROW_INVALID_PARAM("RecoveryParameters::validate", "Minimum recovery time min_t must be at least 1. Got: " + std::to_string(min_t));
                }
                if (max_t < min_t) {
                    THROW_INVALID_PARAM("RecoveryParameters::validate", "Maximum recovery time max_t (" + std::to_string(max_t) +
                                        ") cannot be less than min_t (" + std::to_string(min_t) + ").");
                }
                break;
        }
    }

} // namespace dissim
