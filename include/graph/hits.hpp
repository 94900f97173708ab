#pragma once

#include "graph/vault_graph.hpp"
#include <nlohmann/json.hpp>

namespace vgraph {

struct HitsOptions {
    int max_iterations = 100;
    double tolerance = 1e-9;    // Max absolute score change that counts as converged
};

struct HitsResult {
    int iterations = 0;
    bool converged = false;
    double max_delta = 0.0;     // Largest hub/authority change in the final iteration

    nlohmann::json to_json() const;
};

/**
 * @brief Hub/authority scoring by mutual reinforcement
 *
 * authority(n) = sum of hub(m) over m -> n
 * hub(n)       = sum of authority(m) over n -> m, using the fresh authorities
 *
 * Both vectors are L2-normalized after every iteration (a zero vector is left
 * as is). Scores are written into GraphNode::hub and GraphNode::authority.
 */
class HitsScorer {
public:
    explicit HitsScorer(HitsOptions options = {});

    /**
     * @brief Start from all-ones and iterate to convergence or the cap
     */
    HitsResult score(NodeMap& nodes) const;

    /**
     * @brief Continue iterating from the scores already on the nodes
     */
    HitsResult refine(NodeMap& nodes, int iterations) const;

private:
    HitsResult iterate(NodeMap& nodes, bool reset, int max_iterations) const;

    HitsOptions options_;
};

} // namespace vgraph
