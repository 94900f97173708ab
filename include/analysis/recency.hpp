#pragma once

#include "graph/vault_graph.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace vgraph {

using TimeMap = std::map<std::string, TimePoint>;

// Decay parameters for neighbor-driven recency
struct RecencyOptions {
    int hops = 2;                       // Propagation passes when cascading; one pass otherwise
    int hop_penalty_days = 7;           // Subtracted from a neighbor's time per hop
    int neighbor_window_days = 180;     // Older neighbors contribute nothing
    int neighbor_sample_limit = 5;      // Freshest neighbors considered per node

    nlohmann::json to_json() const;
};

/**
 * @brief Computes effective recency timestamps
 *
 * Each pass lets a note inherit its freshest undirected neighbors' times
 * minus the hop penalty, reading only the previous pass's values. Without
 * cascade a single pass runs over the base times, so only direct neighbors
 * count. With cascade `hops` passes run and a note k hops away contributes
 * at most ts - k * penalty.
 */
class RecencyPropagator {
public:
    explicit RecencyPropagator(RecencyOptions options = {});

    TimeMap effective_times(const NodeMap& nodes, TimePoint now, bool cascade) const;

    // Base timestamps only: future times clamped to now, undated notes omitted
    static TimeMap base_times(const NodeMap& nodes, TimePoint now);

private:
    TimeMap pass(const UndirectedAdjacency& adj, const TimeMap& base,
                 const TimeMap& current, TimePoint now) const;

    RecencyOptions options_;
};

// Fractional days from ts to now, never negative
double age_in_days(TimePoint ts, TimePoint now);

} // namespace vgraph
