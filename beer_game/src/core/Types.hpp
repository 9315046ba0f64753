#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace beergame {

    using Quantity = double;
    using Period = uint64_t;

    // Per-episode lifecycle of an ordering policy
    enum class PolicyPhase {
        ACTIVE,
        TERMINATED
    };

    inline std::string phaseToString(PolicyPhase phase) {
        return phase == PolicyPhase::ACTIVE ? "ACTIVE" : "TERMINATED";
    }

    // Intermediate values of one ordering decision, kept for diagnostics
    struct DecisionBreakdown {
        double demand = 0.0;
        double smoothedDemand = 0.0;
        double demandStd = 0.0;
        double safetyStock = 0.0;
        double pipelineStock = 0.0;
        double targetStock = 0.0;
        double inventoryPosition = 0.0;
        double rawOrder = 0.0;
        Quantity order = 0.0;
    };

    // Default echelon names, position 0 first
    inline const std::vector<std::string>& defaultRoleNames() {
        static const std::vector<std::string> names = {
            "retailer", "wholesaler", "distributor", "factory"
        };
        return names;
    }

    inline std::string roleNameFor(int position, const std::vector<std::string>& names) {
        if (position >= 0 && static_cast<size_t>(position) < names.size()) {
            return names[position];
        }
        return "echelon_" + std::to_string(position);
    }

} // namespace beergame
