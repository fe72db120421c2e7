#pragma once
#include <string>
#include "Core/PriceWindow.hpp"

namespace Pathfinder {
    // A trading agent turns a price history into a signal in [-1, 1]:
    //   -1 strong sell, 0 neutral, +1 strong buy.
    class ISignalAgent {
    public:
        virtual double strategy(const PriceWindow& window) = 0;
        [[nodiscard]] virtual std::string name() const = 0;
        virtual ~ISignalAgent() = default;
    protected:
        ISignalAgent() = default;
    };
}
