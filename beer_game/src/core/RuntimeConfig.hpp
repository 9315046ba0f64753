#pragma once

#include "core/Types.hpp"
#include "utils/Logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace beergame {

    /// JSON-serialisable configuration for the ordering policies and the
    /// episode driver. Every sub-struct carries defaults so a missing config
    /// file still yields a working chain.

    struct RuntimeConfig {

        // ---- Ordering policy constants -----------------------------------------
        struct PolicyParams {
            double safetyStockFactor = 1.5;
            double targetInventoryDays = 14.0;
            double smoothingFactor = 0.3;     // exponential smoothing alpha, (0, 1]
            double baseLeadTime = 2.0;        // periods
            double positionFactor = 1.5;      // extra lead time per echelon
        } policy;

        // ---- Supply chain layout -------------------------------------------------
        struct ChainParams {
            int    echelons = 4;
            double orderCeiling = 100.0;      // used when the environment publishes none
            std::vector<std::string> roleNames = defaultRoleNames();
        } chain;

        // ---- Episode control -----------------------------------------------------
        struct EpisodeParams {
            int maxPeriods = 0;               // 0 = run until the trace ends
        } episode;

        // ---- Logging -------------------------------------------------------------
        struct LoggingParams {
            std::string file = "beer_game.log";
            std::string level = "info";
            bool console = true;
        } logging;

        nlohmann::json toJson() const {
            nlohmann::json j;
            j["policy"] = {
                {"safetyStockFactor",   policy.safetyStockFactor},
                {"targetInventoryDays", policy.targetInventoryDays},
                {"smoothingFactor",     policy.smoothingFactor},
                {"baseLeadTime",        policy.baseLeadTime},
                {"positionFactor",      policy.positionFactor}
            };
            j["chain"] = {
                {"echelons",     chain.echelons},
                {"orderCeiling", chain.orderCeiling},
                {"roleNames",    chain.roleNames}
            };
            j["episode"] = {
                {"maxPeriods", episode.maxPeriods}
            };
            j["logging"] = {
                {"file",    logging.file},
                {"level",   logging.level},
                {"console", logging.console}
            };
            return j;
        }

        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("policy")) {
                auto& p = j["policy"];
                get(p, "safetyStockFactor", policy.safetyStockFactor);
                get(p, "targetInventoryDays", policy.targetInventoryDays);
                get(p, "smoothingFactor", policy.smoothingFactor);
                get(p, "baseLeadTime", policy.baseLeadTime);
                get(p, "positionFactor", policy.positionFactor);
            }

            if (j.contains("chain")) {
                auto& c = j["chain"];
                get(c, "echelons", chain.echelons);
                get(c, "orderCeiling", chain.orderCeiling);
                get(c, "roleNames", chain.roleNames);
            }

            if (j.contains("episode")) {
                get(j["episode"], "maxPeriods", episode.maxPeriods);
            }

            if (j.contains("logging")) {
                auto& l = j["logging"];
                get(l, "file", logging.file);
                get(l, "level", logging.level);
                get(l, "console", logging.console);
            }

            validate();
        }

        void validate() const {
            if (!(policy.smoothingFactor > 0.0 && policy.smoothingFactor <= 1.0)) {
                throw std::invalid_argument("policy.smoothingFactor must be in (0, 1]");
            }
            if (policy.baseLeadTime < 0.0 || policy.positionFactor < 0.0) {
                throw std::invalid_argument("policy lead time parameters must be non-negative");
            }
            if (chain.echelons <= 0) {
                throw std::invalid_argument("chain.echelons must be positive");
            }
            if (chain.orderCeiling < 0.0) {
                throw std::invalid_argument("chain.orderCeiling must be non-negative");
            }
            if (episode.maxPeriods < 0) {
                throw std::invalid_argument("episode.maxPeriods must be non-negative");
            }
        }

        /// Missing file: defaults with a warning. Unparseable or ill-typed
        /// content throws std::invalid_argument.
        static RuntimeConfig loadFromFile(const std::string& path) {
            RuntimeConfig cfg;

            std::ifstream file(path);
            if (!file.is_open()) {
                Logger::warn("Could not open config file: {}, using defaults", path);
                return cfg;
            }

            try {
                cfg.fromJson(nlohmann::json::parse(file));
            }
            catch (const nlohmann::json::exception& e) {
                throw std::invalid_argument("Failed to parse config " + path + ": " + e.what());
            }

            Logger::info("Configuration loaded from {}", path);
            return cfg;
        }
    };

} // namespace beergame
