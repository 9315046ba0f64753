#pragma once

#include <vector>
#include <cmath>
#include <numeric>

namespace beergame {

class Statistics {
public:
    static double sum(const std::vector<double>& data) {
        return std::accumulate(data.begin(), data.end(), 0.0);
    }

    static double mean(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return sum(data) / data.size();
    }

    // Population variance (divides by N)
    static double variance(const std::vector<double>& data) {
        if (data.size() < 2) return 0.0;

        double m = mean(data);
        double sqSum = 0.0;
        for (double x : data) {
            sqSum += (x - m) * (x - m);
        }
        return sqSum / data.size();
    }

    static double stddev(const std::vector<double>& data) {
        return std::sqrt(variance(data));
    }

    // Ratio of order variance to demand variance; > 1 means amplification
    static double bullwhipRatio(const std::vector<double>& orders, const std::vector<double>& demand) {
        double demandVar = variance(demand);
        if (demandVar <= 0) return 0.0;
        return variance(orders) / demandVar;
    }
};

} // namespace beergame
