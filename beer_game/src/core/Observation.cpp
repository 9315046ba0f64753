#include "Observation.hpp"
#include <cmath>
#include <stdexcept>

namespace beergame {

    namespace {

        const std::array<std::string, Observation::FIELD_COUNT> CAMEL_NAMES = {
            "inventory", "backorders", "orders",
            "incomingShipments", "holdingCost", "backorderCost"
        };

        double checkedValue(double value, const std::string& field) {
            if (!std::isfinite(value)) {
                throw std::invalid_argument("Observation field '" + field + "' is not finite");
            }
            return value;
        }

        // A scalar may arrive bare or wrapped in a one-element array
        double readScalar(const nlohmann::json& value, const std::string& field) {
            if (value.is_number()) {
                return checkedValue(value.get<double>(), field);
            }
            if (value.is_array() && value.size() == 1 && value[0].is_number()) {
                return checkedValue(value[0].get<double>(), field);
            }
            throw std::invalid_argument("Observation field '" + field + "' is not a number");
        }

        double readField(const nlohmann::json& obj, size_t index) {
            const std::string& snake = Observation::fieldNames()[index];
            const std::string& camel = CAMEL_NAMES[index];

            if (obj.contains(snake)) return readScalar(obj[snake], snake);
            if (obj.contains(camel)) return readScalar(obj[camel], camel);
            throw std::invalid_argument("Observation is missing field '" + snake + "'");
        }

    } // namespace

    const std::array<std::string, Observation::FIELD_COUNT>& Observation::fieldNames() {
        static const std::array<std::string, FIELD_COUNT> names = {
            "inventory", "backorders", "orders",
            "incoming_shipments", "holding_cost", "backorder_cost"
        };
        return names;
    }

    Observation Observation::fromArray(const std::vector<double>& values) {
        if (values.size() != FIELD_COUNT) {
            throw std::invalid_argument("Observation expects " + std::to_string(FIELD_COUNT)
                + " values, got " + std::to_string(values.size()));
        }

        const auto& names = fieldNames();
        Observation obs;
        obs.inventory = checkedValue(values[0], names[0]);
        obs.backorders = checkedValue(values[1], names[1]);
        obs.orders = checkedValue(values[2], names[2]);
        obs.incomingShipments = checkedValue(values[3], names[3]);
        obs.holdingCost = checkedValue(values[4], names[4]);
        obs.backorderCost = checkedValue(values[5], names[5]);
        return obs;
    }

    Observation Observation::fromJson(const nlohmann::json& j) {
        if (j.is_array()) {
            std::vector<double> values;
            values.reserve(j.size());
            for (size_t i = 0; i < j.size(); ++i) {
                values.push_back(readScalar(j[i], "[" + std::to_string(i) + "]"));
            }
            return fromArray(values);
        }

        if (!j.is_object()) {
            throw std::invalid_argument("Observation must be an array or an object");
        }

        Observation obs;
        obs.inventory = readField(j, 0);
        obs.backorders = readField(j, 1);
        obs.orders = readField(j, 2);
        obs.incomingShipments = readField(j, 3);
        obs.holdingCost = readField(j, 4);
        obs.backorderCost = readField(j, 5);
        return obs;
    }

    void Observation::validate() const {
        const auto values = toArray();
        const auto& names = fieldNames();
        for (size_t i = 0; i < FIELD_COUNT; ++i) {
            checkedValue(values[i], names[i]);
        }
    }

    std::array<double, Observation::FIELD_COUNT> Observation::toArray() const {
        return { inventory, backorders, orders, incomingShipments, holdingCost, backorderCost };
    }

    nlohmann::json Observation::toJson() const {
        nlohmann::json j;
        const auto values = toArray();
        const auto& names = fieldNames();
        for (size_t i = 0; i < FIELD_COUNT; ++i) {
            j[names[i]] = values[i];
        }
        return j;
    }

} // namespace beergame
