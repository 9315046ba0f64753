#pragma once

#include "core/Types.hpp"
#include "core/Observation.hpp"
#include "core/RollingWindow.hpp"
#include "core/RuntimeConfig.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beergame {

    struct AgentConfig {
        int position = 0;                 // 0 = retailer
        std::string name = "retailer";
        double safetyStockFactor = 1.5;
        double targetInventoryDays = 14.0;
        double smoothingFactor = 0.3;
        double baseLeadTime = 2.0;
        double positionFactor = 1.5;
        double orderCeiling = 100.0;

        static AgentConfig fromRuntimeConfig(int position, double orderCeiling,
            const RuntimeConfig* cfg = nullptr);
    };

    /// Base-stock ordering rule for one echelon with exponential demand
    /// smoothing, a variance-driven safety stock and order blending against
    /// the bullwhip effect. One instance per agent per episode.
    class OrderingPolicy {
    public:
        static constexpr size_t DEMAND_HISTORY = 8;
        static constexpr size_t ORDER_HISTORY = 4;
        static constexpr double SERVICE_LEVEL_Z = 1.96;      // 95% one-sided
        static constexpr double FALLBACK_STD_RATIO = 0.2;
        static constexpr double RAW_ORDER_WEIGHT = 0.7;
        static constexpr double LAST_ORDER_WEIGHT = 0.3;
        static constexpr double AMPLIFICATION_PER_ECHELON = 0.1;

        using DemandWindow = RollingWindow<double, DEMAND_HISTORY>;
        using OrderWindow = RollingWindow<Quantity, ORDER_HISTORY>;

        explicit OrderingPolicy(const AgentConfig& config);
        OrderingPolicy(int position, double orderCeiling, const RuntimeConfig* cfg = nullptr);

        // Returns 0 without touching state once the episode has ended
        Quantity decide(const Observation& obs, bool terminated = false, bool truncated = false);
        Quantity decide(const std::vector<double>& obs, bool terminated = false, bool truncated = false);
        Quantity decide(const nlohmann::json& obs, bool terminated = false, bool truncated = false);

        // Back to the freshly-constructed state for a new episode
        void reset();

        // Pure derivations from chain position
        static double deriveLeadTime(int position, double baseLeadTime, double positionFactor);
        static double upstreamAmplification(int position);

        // Getters
        const AgentConfig& getConfig() const { return config_; }
        int getPosition() const { return config_.position; }
        const std::string& getName() const { return config_.name; }
        double getLeadTime() const { return leadTime_; }
        double getAmplification() const { return amplification_; }
        double getOrderCeiling() const { return config_.orderCeiling; }

        const DemandWindow& getDemandHistory() const { return demandHistory_; }
        const OrderWindow& getLastOrders() const { return lastOrders_; }
        std::optional<double> getSmoothedDemand() const { return smoothedDemand_; }
        PolicyPhase getPhase() const { return phase_; }
        bool isTerminated() const { return phase_ == PolicyPhase::TERMINATED; }
        const std::optional<DecisionBreakdown>& getLastDecision() const { return lastDecision_; }

    private:
        AgentConfig config_;
        double leadTime_;
        double amplification_;

        DemandWindow demandHistory_;
        OrderWindow lastOrders_;
        std::optional<double> smoothedDemand_;
        PolicyPhase phase_ = PolicyPhase::ACTIVE;
        std::optional<DecisionBreakdown> lastDecision_;

        double estimateDemand(double demand);
        double estimateDemandStd() const;
        double calculateSafetyStock(double demandStd) const;
        double calculateInventoryPosition(const Observation& obs) const;
    };

    // Builds one policy per echelon of a linear chain
    class PolicyFactory {
    public:
        static std::unique_ptr<OrderingPolicy> createPolicy(int position, double orderCeiling,
            const RuntimeConfig* cfg = nullptr);

        static std::vector<std::unique_ptr<OrderingPolicy>> createChain(int echelons,
            double orderCeiling, const RuntimeConfig* cfg = nullptr);
    };

} // namespace beergame
