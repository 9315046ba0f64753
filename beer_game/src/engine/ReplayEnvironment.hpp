#pragma once

#include "Environment.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace beergame {

    /// Replays recorded per-period observations for every echelon. The
    /// episode terminates when the trace runs out and is truncated once
    /// maxPeriods periods have been played (0 = no limit).
    class ReplayEnvironment : public Environment {
    public:
        ReplayEnvironment(std::vector<std::vector<Observation>> periods,
            double orderCeiling, int maxPeriods = 0);

        // Trace layout: {"orderCeiling": x, "agents": n, "periods": [[obs...], ...]}
        static ReplayEnvironment fromJson(const nlohmann::json& trace,
            double defaultOrderCeiling, int maxPeriods = 0);
        static ReplayEnvironment fromFile(const std::string& path,
            double defaultOrderCeiling, int maxPeriods = 0);

        int getAgentCount() const override { return agentCount_; }
        double getOrderCeiling() const override { return orderCeiling_; }
        Period getPeriod() const override { return period_; }

        void reset() override;
        StepView last(int position) const override;
        void step(int position, Quantity quantity) override;

        size_t getTraceLength() const { return periods_.size(); }
        int getMaxPeriods() const { return maxPeriods_; }

        // submitted[period][position]
        const std::vector<std::vector<Quantity>>& getSubmittedOrders() const { return submitted_; }

    private:
        std::vector<std::vector<Observation>> periods_;
        double orderCeiling_;
        int maxPeriods_;
        int agentCount_;

        Period period_ = 0;
        int nextPosition_ = 0;
        std::vector<std::vector<Quantity>> submitted_;

        bool isTerminated() const;
        bool isTruncated() const;
    };

} // namespace beergame
