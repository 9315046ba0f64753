#pragma once

#include "Environment.hpp"
#include "agents/OrderingPolicy.hpp"
#include "core/RuntimeConfig.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace beergame {

    struct PeriodRecord {
        Period period = 0;
        std::vector<double> demand;       // per position
        std::vector<Quantity> orders;     // per position
    };

    struct AgentSummary {
        int position = 0;
        std::string name;
        double leadTime = 0.0;
        size_t decisions = 0;
        double meanOrder = 0.0;
        double orderStd = 0.0;
        double meanDemand = 0.0;
        double demandStd = 0.0;
        double bullwhipRatio = 0.0;       // var(orders) / var(demand)
    };

    struct EpisodeReport {
        std::vector<PeriodRecord> periods;
        std::vector<AgentSummary> agents;
        bool terminated = false;
        bool truncated = false;

        nlohmann::json toJson() const;
    };

    /// Drives one ordering policy per echelon through an environment in turn
    /// order until the environment signals the end of the episode.
    class EpisodeRunner {
    public:
        explicit EpisodeRunner(Environment& env, const RuntimeConfig* cfg = nullptr);

        EpisodeReport runEpisode();

        const std::vector<std::unique_ptr<OrderingPolicy>>& getPolicies() const { return policies_; }
        OrderingPolicy& getPolicy(int position) { return *policies_.at(position); }

    private:
        Environment& env_;
        const RuntimeConfig* rtConfig_ = nullptr;
        std::vector<std::unique_ptr<OrderingPolicy>> policies_;

        std::vector<AgentSummary> summarize(const std::vector<PeriodRecord>& periods) const;
    };

} // namespace beergame
