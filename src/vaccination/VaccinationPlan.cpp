#include "vaccination/VaccinationPlan.hpp"
#include "exceptions/Exceptions.hpp"

namespace dissim {

    VaccinationPlan::VaccinationPlan(std::vector<std::string> vertices) {
        vertices_.reserve(vertices.size());
        for (auto& vertex : vertices) {
            add(vertex);
        }
    }

    void VaccinationPlan::add(const std::string& vertex) {
        if (!members_.insert(vertex).second) {
            THROW_INVALID_PARAM("VaccinationPlan::add", "Vertex '" + vertex + "' is already in the vaccination plan.");
        }
        vertices_.push_back(vertex);
    }

} // namespace dissim
