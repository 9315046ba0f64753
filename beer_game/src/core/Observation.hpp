#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <vector>

namespace beergame {

    /// One period's view of the supply chain from a single echelon.
    struct Observation {
        static constexpr size_t FIELD_COUNT = 6;

        double inventory = 0.0;
        double backorders = 0.0;
        double orders = 0.0;             // demand signal received this period
        double incomingShipments = 0.0;
        double holdingCost = 0.0;
        double backorderCost = 0.0;

        double netInventory() const { return inventory - backorders; }

        // Throws std::invalid_argument naming the first non-finite field
        void validate() const;

        // Positional layout: inventory, backorders, orders, incoming_shipments,
        // holding_cost, backorder_cost
        static Observation fromArray(const std::vector<double>& values);
        static Observation fromJson(const nlohmann::json& j);

        std::array<double, FIELD_COUNT> toArray() const;
        nlohmann::json toJson() const;

        static const std::array<std::string, FIELD_COUNT>& fieldNames();
    };

} // namespace beergame
