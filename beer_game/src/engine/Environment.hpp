#pragma once

#include "core/Types.hpp"
#include "core/Observation.hpp"

namespace beergame {

    // What an agent sees when its turn comes up
    struct StepView {
        Observation observation;
        bool terminated = false;
        bool truncated = false;

        bool done() const { return terminated || truncated; }
    };

    /// Turn-based supply chain environment. Within a period agents act in
    /// position order 0..N-1; the period advances after the last agent steps.
    class Environment {
    public:
        virtual ~Environment() = default;

        virtual int getAgentCount() const = 0;

        // Upper bound of the order action space
        virtual double getOrderCeiling() const = 0;

        virtual Period getPeriod() const = 0;

        virtual void reset() = 0;

        virtual StepView last(int position) const = 0;

        virtual void step(int position, Quantity quantity) = 0;
    };

} // namespace beergame
