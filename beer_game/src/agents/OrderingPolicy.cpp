#include "OrderingPolicy.hpp"
#include "utils/Logger.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace beergame {

    AgentConfig AgentConfig::fromRuntimeConfig(int position, double orderCeiling,
        const RuntimeConfig* cfg)
    {
        AgentConfig config;
        config.position = position;
        config.orderCeiling = orderCeiling;
        config.name = roleNameFor(position, cfg ? cfg->chain.roleNames : defaultRoleNames());

        if (cfg) {
            config.safetyStockFactor = cfg->policy.safetyStockFactor;
            config.targetInventoryDays = cfg->policy.targetInventoryDays;
            config.smoothingFactor = cfg->policy.smoothingFactor;
            config.baseLeadTime = cfg->policy.baseLeadTime;
            config.positionFactor = cfg->policy.positionFactor;
        }
        return config;
    }

    OrderingPolicy::OrderingPolicy(const AgentConfig& config)
        : config_(config)
        , leadTime_(0.0)
        , amplification_(1.0)
    {
        if (config_.position < 0) {
            throw std::invalid_argument("position must be non-negative, got "
                + std::to_string(config_.position));
        }
        if (!std::isfinite(config_.orderCeiling) || config_.orderCeiling < 0.0) {
            throw std::invalid_argument("orderCeiling must be a non-negative finite value");
        }
        if (!(config_.smoothingFactor > 0.0 && config_.smoothingFactor <= 1.0)) {
            throw std::invalid_argument("smoothingFactor must be in (0, 1]");
        }
        if (config_.baseLeadTime < 0.0 || config_.positionFactor < 0.0) {
            throw std::invalid_argument("lead time parameters must be non-negative");
        }

        leadTime_ = deriveLeadTime(config_.position, config_.baseLeadTime, config_.positionFactor);
        amplification_ = upstreamAmplification(config_.position);
    }

    OrderingPolicy::OrderingPolicy(int position, double orderCeiling, const RuntimeConfig* cfg)
        : OrderingPolicy(AgentConfig::fromRuntimeConfig(position, orderCeiling, cfg))
    {
    }

    double OrderingPolicy::deriveLeadTime(int position, double baseLeadTime, double positionFactor) {
        return baseLeadTime + position * positionFactor;
    }

    double OrderingPolicy::upstreamAmplification(int position) {
        return position > 0 ? 1.0 + AMPLIFICATION_PER_ECHELON * position : 1.0;
    }

    Quantity OrderingPolicy::decide(const std::vector<double>& obs, bool terminated, bool truncated) {
        if (terminated || truncated || isTerminated()) {
            return decide(Observation{}, terminated, truncated);
        }
        return decide(Observation::fromArray(obs), terminated, truncated);
    }

    Quantity OrderingPolicy::decide(const nlohmann::json& obs, bool terminated, bool truncated) {
        if (terminated || truncated || isTerminated()) {
            return decide(Observation{}, terminated, truncated);
        }
        return decide(Observation::fromJson(obs), terminated, truncated);
    }

    Quantity OrderingPolicy::decide(const Observation& obs, bool terminated, bool truncated) {
        if (terminated || truncated) {
            if (phase_ == PolicyPhase::ACTIVE) {
                Logger::debug("{} [pos {}] {} -> {} after {} orders",
                    config_.name, config_.position, phaseToString(PolicyPhase::ACTIVE),
                    phaseToString(PolicyPhase::TERMINATED), lastOrders_.size());
            }
            phase_ = PolicyPhase::TERMINATED;
            return 0.0;
        }
        if (phase_ == PolicyPhase::TERMINATED) {
            return 0.0;
        }

        obs.validate();

        DecisionBreakdown d;
        d.demand = obs.orders;
        d.smoothedDemand = estimateDemand(obs.orders);
        d.demandStd = estimateDemandStd();

        d.safetyStock = calculateSafetyStock(d.demandStd);
        d.pipelineStock = d.smoothedDemand * leadTime_;
        d.targetStock = d.safetyStock + d.pipelineStock;
        d.inventoryPosition = calculateInventoryPosition(obs);

        d.rawOrder = std::max(0.0, d.smoothedDemand + (d.targetStock - d.inventoryPosition));

        double order = d.rawOrder;
        if (!lastOrders_.empty()) {
            order = RAW_ORDER_WEIGHT * order + LAST_ORDER_WEIGHT * lastOrders_.back();
        }
        order *= amplification_;
        order = std::clamp(order, 0.0, config_.orderCeiling);

        d.order = order;
        lastOrders_.push(order);
        lastDecision_ = d;

        Logger::debug("{} [pos {}] demand={:.2f} smoothed={:.2f} std={:.2f} target={:.2f} position={:.2f} order={:.2f}",
            config_.name, config_.position, d.demand, d.smoothedDemand, d.demandStd,
            d.targetStock, d.inventoryPosition, d.order);

        return order;
    }

    void OrderingPolicy::reset() {
        demandHistory_.clear();
        lastOrders_.clear();
        smoothedDemand_.reset();
        lastDecision_.reset();
        phase_ = PolicyPhase::ACTIVE;
    }

    double OrderingPolicy::estimateDemand(double demand) {
        demandHistory_.push(demand);

        if (!smoothedDemand_) {
            smoothedDemand_ = demand;
        }
        else {
            double alpha = config_.smoothingFactor;
            smoothedDemand_ = alpha * demand + (1.0 - alpha) * *smoothedDemand_;
        }
        return *smoothedDemand_;
    }

    double OrderingPolicy::estimateDemandStd() const {
        if (demandHistory_.size() < 2) {
            return FALLBACK_STD_RATIO * smoothedDemand_.value_or(0.0);
        }
        return Statistics::stddev(demandHistory_.toVector());
    }

    double OrderingPolicy::calculateSafetyStock(double demandStd) const {
        return SERVICE_LEVEL_Z * demandStd * std::sqrt(leadTime_);
    }

    // Every tracked past order is counted, including ones that may already
    // have arrived as shipments.
    double OrderingPolicy::calculateInventoryPosition(const Observation& obs) const {
        return obs.netInventory() + obs.incomingShipments + lastOrders_.sum();
    }

    // PolicyFactory implementation

    std::unique_ptr<OrderingPolicy> PolicyFactory::createPolicy(int position, double orderCeiling,
        const RuntimeConfig* cfg)
    {
        return std::make_unique<OrderingPolicy>(position, orderCeiling, cfg);
    }

    std::vector<std::unique_ptr<OrderingPolicy>> PolicyFactory::createChain(int echelons,
        double orderCeiling, const RuntimeConfig* cfg)
    {
        if (echelons <= 0) {
            throw std::invalid_argument("a supply chain needs at least one echelon");
        }

        std::vector<std::unique_ptr<OrderingPolicy>> policies;
        policies.reserve(echelons);
        for (int position = 0; position < echelons; ++position) {
            policies.push_back(createPolicy(position, orderCeiling, cfg));
        }

        Logger::info("Created {} ordering policies (order ceiling {})", policies.size(), orderCeiling);
        return policies;
    }

} // namespace beergame
