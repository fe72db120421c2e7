#pragma once

namespace Pathfinder {
    struct DijkstraConfig {
        int lookback_window = 42;           // samples used for discretization and graph
        double risk_weight = 0.7;           // risk vs reward blend in edge weights
        double state_threshold = 0.25;      // trend significance
        int structure_levels = 3;           // 1..3 decision levels enabled
        double deadlock_sensitivity = 1.5;  // deadlock score scaling

        bool operator==(const DijkstraConfig&) const = default;
    };
}
