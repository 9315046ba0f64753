#include "EpisodeRunner.hpp"
#include "utils/Logger.hpp"
#include "utils/Statistics.hpp"

namespace beergame {

    EpisodeRunner::EpisodeRunner(Environment& env, const RuntimeConfig* cfg)
        : env_(env)
        , rtConfig_(cfg)
    {
        int echelons = env_.getAgentCount();
        if (rtConfig_ && rtConfig_->chain.echelons != echelons) {
            Logger::warn("Config asks for {} echelons but the environment has {}, using {}",
                rtConfig_->chain.echelons, echelons, echelons);
        }

        // The order ceiling comes from the environment's action space
        policies_ = PolicyFactory::createChain(echelons, env_.getOrderCeiling(), rtConfig_);
    }

    EpisodeReport EpisodeRunner::runEpisode() {
        env_.reset();
        for (auto& policy : policies_) {
            policy->reset();
        }

        Logger::info("Episode started with {} agents", policies_.size());

        EpisodeReport report;

        while (true) {
            PeriodRecord record;
            record.period = env_.getPeriod();
            bool episodeOver = false;

            for (auto& policy : policies_) {
                int position = policy->getPosition();
                StepView view = env_.last(position);

                Quantity order = policy->decide(view.observation, view.terminated, view.truncated);

                if (view.done()) {
                    // Each policy still receives its terminal call
                    episodeOver = true;
                    report.terminated = report.terminated || view.terminated;
                    report.truncated = report.truncated || view.truncated;
                    continue;
                }

                env_.step(position, order);
                record.demand.push_back(view.observation.orders);
                record.orders.push_back(order);
            }

            if (episodeOver) break;
            report.periods.push_back(std::move(record));
        }

        report.agents = summarize(report.periods);

        Logger::info("Episode finished after {} periods ({})", report.periods.size(),
            report.truncated ? "truncated" : "terminated");
        return report;
    }

    std::vector<AgentSummary> EpisodeRunner::summarize(const std::vector<PeriodRecord>& periods) const {
        std::vector<AgentSummary> summaries;

        for (const auto& policy : policies_) {
            int position = policy->getPosition();
            std::vector<double> demand;
            std::vector<double> orders;
            for (const auto& record : periods) {
                if (static_cast<size_t>(position) < record.orders.size()) {
                    demand.push_back(record.demand[position]);
                    orders.push_back(record.orders[position]);
                }
            }

            AgentSummary s;
            s.position = position;
            s.name = policy->getName();
            s.leadTime = policy->getLeadTime();
            s.decisions = orders.size();
            s.meanOrder = Statistics::mean(orders);
            s.orderStd = Statistics::stddev(orders);
            s.meanDemand = Statistics::mean(demand);
            s.demandStd = Statistics::stddev(demand);
            s.bullwhipRatio = Statistics::bullwhipRatio(orders, demand);
            summaries.push_back(s);
        }
        return summaries;
    }

    nlohmann::json EpisodeReport::toJson() const {
        nlohmann::json j;
        j["terminated"] = terminated;
        j["truncated"] = truncated;

        j["periods"] = nlohmann::json::array();
        for (const auto& record : periods) {
            j["periods"].push_back({
                {"period", record.period},
                {"demand", record.demand},
                {"orders", record.orders}
            });
        }

        j["agents"] = nlohmann::json::array();
        for (const auto& s : agents) {
            j["agents"].push_back({
                {"position",      s.position},
                {"name",          s.name},
                {"leadTime",      s.leadTime},
                {"decisions",     s.decisions},
                {"meanOrder",     s.meanOrder},
                {"orderStd",      s.orderStd},
                {"meanDemand",    s.meanDemand},
                {"demandStd",     s.demandStd},
                {"bullwhipRatio", s.bullwhipRatio}
            });
        }
        return j;
    }

} // namespace beergame
