#include "ReplayEnvironment.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace beergame {

    ReplayEnvironment::ReplayEnvironment(std::vector<std::vector<Observation>> periods,
        double orderCeiling, int maxPeriods)
        : periods_(std::move(periods))
        , orderCeiling_(orderCeiling)
        , maxPeriods_(maxPeriods)
        , agentCount_(0)
    {
        if (periods_.empty()) {
            throw std::invalid_argument("replay trace has no periods");
        }
        if (orderCeiling_ < 0.0) {
            throw std::invalid_argument("orderCeiling must be non-negative");
        }
        if (maxPeriods_ < 0) {
            throw std::invalid_argument("maxPeriods must be non-negative");
        }

        agentCount_ = static_cast<int>(periods_.front().size());
        if (agentCount_ == 0) {
            throw std::invalid_argument("replay trace has no agents");
        }
        for (size_t t = 0; t < periods_.size(); ++t) {
            if (periods_[t].size() != static_cast<size_t>(agentCount_)) {
                throw std::invalid_argument("period " + std::to_string(t) + " has "
                    + std::to_string(periods_[t].size()) + " observations, expected "
                    + std::to_string(agentCount_));
            }
        }
    }

    ReplayEnvironment ReplayEnvironment::fromJson(const nlohmann::json& trace,
        double defaultOrderCeiling, int maxPeriods)
    {
        if (!trace.is_object() || !trace.contains("periods") || !trace["periods"].is_array()) {
            throw std::runtime_error("trace must be an object with a 'periods' array");
        }

        double orderCeiling = defaultOrderCeiling;
        int expectedAgents = -1;

        try {
            orderCeiling = trace.value("orderCeiling", defaultOrderCeiling);
            expectedAgents = trace.value("agents", -1);
        }
        catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("invalid trace header: ") + e.what());
        }

        std::vector<std::vector<Observation>> periods;
        const auto& rows = trace["periods"];
        periods.reserve(rows.size());

        for (size_t t = 0; t < rows.size(); ++t) {
            if (!rows[t].is_array()) {
                throw std::runtime_error("period " + std::to_string(t) + " is not an array");
            }
            if (expectedAgents >= 0 && rows[t].size() != static_cast<size_t>(expectedAgents)) {
                throw std::runtime_error("period " + std::to_string(t) + " has "
                    + std::to_string(rows[t].size()) + " observations, expected "
                    + std::to_string(expectedAgents));
            }

            std::vector<Observation> row;
            row.reserve(rows[t].size());
            for (size_t pos = 0; pos < rows[t].size(); ++pos) {
                try {
                    row.push_back(Observation::fromJson(rows[t][pos]));
                }
                catch (const std::invalid_argument& e) {
                    throw std::runtime_error("period " + std::to_string(t) + ", agent "
                        + std::to_string(pos) + ": " + e.what());
                }
            }
            periods.push_back(std::move(row));
        }

        try {
            return ReplayEnvironment(std::move(periods), orderCeiling, maxPeriods);
        }
        catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("invalid trace: ") + e.what());
        }
    }

    ReplayEnvironment ReplayEnvironment::fromFile(const std::string& path,
        double defaultOrderCeiling, int maxPeriods)
    {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open trace file: " + path);
        }

        nlohmann::json trace;
        try {
            trace = nlohmann::json::parse(file);
        }
        catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Failed to parse trace " + path + ": " + e.what());
        }

        auto env = fromJson(trace, defaultOrderCeiling, maxPeriods);
        Logger::info("Loaded trace {} ({} periods, {} agents)",
            path, env.getTraceLength(), env.getAgentCount());
        return env;
    }

    void ReplayEnvironment::reset() {
        period_ = 0;
        nextPosition_ = 0;
        submitted_.clear();
    }

    bool ReplayEnvironment::isTerminated() const {
        return period_ >= periods_.size();
    }

    bool ReplayEnvironment::isTruncated() const {
        return !isTerminated() && maxPeriods_ > 0 && period_ >= static_cast<Period>(maxPeriods_);
    }

    StepView ReplayEnvironment::last(int position) const {
        if (position < 0 || position >= agentCount_) {
            throw std::out_of_range("agent position " + std::to_string(position) + " out of range");
        }

        // Past the end the final observation is repeated alongside the terminal flag
        size_t row = std::min<size_t>(period_, periods_.size() - 1);

        StepView view;
        view.observation = periods_[row][position];
        view.terminated = isTerminated();
        view.truncated = isTruncated();
        return view;
    }

    void ReplayEnvironment::step(int position, Quantity quantity) {
        if (isTerminated() || isTruncated()) {
            throw std::logic_error("step() called after the episode ended");
        }
        if (position != nextPosition_) {
            throw std::logic_error("agent " + std::to_string(position)
                + " stepped out of turn, expected " + std::to_string(nextPosition_));
        }
        if (quantity < 0.0 || quantity > orderCeiling_) {
            throw std::out_of_range("order quantity outside [0, orderCeiling]");
        }

        if (nextPosition_ == 0) {
            submitted_.emplace_back();
        }
        submitted_.back().push_back(quantity);

        if (++nextPosition_ == agentCount_) {
            nextPosition_ = 0;
            ++period_;
        }
    }

} // namespace beergame
