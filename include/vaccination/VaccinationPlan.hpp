#ifndef VACCINATION_PLAN_HPP
#define VACCINATION_PLAN_HPP

#include <string>
#include <vector>
#include <unordered_set>

namespace dissim {

    /**
     * @brief The vertices removed from the contact graph before any trial runs.
     *
     * Keeps the selection order alongside a set for membership tests. Built
     * once per configuration and then shared read-only by every trial.
     */
    class VaccinationPlan {
    public:
        VaccinationPlan() = default;

        /**
         * @throws InvalidParameterException If a vertex appears twice.
         */
        explicit VaccinationPlan(std::vector<std::string> vertices);

        /** @brief Appends a vertex; throws InvalidParameterException if it is already planned. */
        void add(const std::string& vertex);

        bool contains(const std::string& vertex) const { return members_.count(vertex) > 0; }
        size_t size() const { return vertices_.size(); }
        bool empty() const { return vertices_.empty(); }

        /** @brief Vertices in selection order. */
        const std::vector<std::string>& vertices() const { return vertices_; }
        const std::unordered_set<std::string>& members() const { return members_; }

    private:
        std::vector<std::string> vertices_;
        std::unordered_set<std::string> members_;
    };

} // namespace dissim

#endif // VACCINATION_PLAN_HPP
