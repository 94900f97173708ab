#include "graph/hits.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace vgraph {

namespace {

void normalize_l2(std::vector<double>& v) {
    double norm = 0.0;
    for (double x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (double& x : v) x /= norm;
    }
}

} // namespace

nlohmann::json HitsResult::to_json() const {
    nlohmann::json j;
    j["iterations"] = iterations;
    j["converged"] = converged;
    j["maxDelta"] = max_delta;
    return j;
}

HitsScorer::HitsScorer(HitsOptions options)
    : options_(options) {}

HitsResult HitsScorer::score(NodeMap& nodes) const {
    return iterate(nodes, true, options_.max_iterations);
}

HitsResult HitsScorer::refine(NodeMap& nodes, int iterations) const {
    return iterate(nodes, false, iterations);
}

HitsResult HitsScorer::iterate(NodeMap& nodes, bool reset, int max_iterations) const {
    HitsResult result;
    const size_t n = nodes.size();
    if (n == 0) {
        result.converged = true;
        return result;
    }

    // Index nodes in path order; edges become index lists
    std::vector<GraphNode*> order;
    order.reserve(n);
    std::unordered_map<std::string, size_t> index;
    for (auto& [path, node] : nodes) {
        index[path] = order.size();
        order.push_back(&node);
    }

    std::vector<std::vector<size_t>> out(n);
    for (size_t i = 0; i < n; ++i) {
        for (const auto& dst : order[i]->neighbors) {
            auto it = index.find(dst);
            if (it != index.end()) out[i].push_back(it->second);
        }
    }

    std::vector<double> hub(n, 1.0);
    std::vector<double> auth(n, 1.0);
    if (!reset) {
        for (size_t i = 0; i < n; ++i) {
            hub[i] = order[i]->hub;
            auth[i] = order[i]->authority;
        }
    }

    std::vector<double> new_hub(n);
    std::vector<double> new_auth(n);

    for (int iter = 0; iter < max_iterations; ++iter) {
        std::fill(new_auth.begin(), new_auth.end(), 0.0);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j : out[i]) {
                new_auth[j] += hub[i];
            }
        }

        for (size_t i = 0; i < n; ++i) {
            double sum = 0.0;
            for (size_t j : out[i]) {
                sum += new_auth[j];
            }
            new_hub[i] = sum;
        }

        normalize_l2(new_auth);
        normalize_l2(new_hub);

        double delta = 0.0;
        for (size_t i = 0; i < n; ++i) {
            delta = std::max(delta, std::abs(new_auth[i] - auth[i]));
            delta = std::max(delta, std::abs(new_hub[i] - hub[i]));
        }

        hub.swap(new_hub);
        auth.swap(new_auth);
        result.iterations = iter + 1;
        result.max_delta = delta;

        if (delta < options_.tolerance) {
            result.converged = true;
            break;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        order[i]->hub = hub[i];
        order[i]->authority = auth[i];
    }
    return result;
}

} // namespace vgraph
