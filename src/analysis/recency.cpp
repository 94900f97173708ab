#include "analysis/recency.hpp"
#include <algorithm>
#include <functional>
#include <vector>

namespace vgraph {

namespace {

std::chrono::hours days(int n) {
    return std::chrono::hours(24 * n);
}

} // namespace

nlohmann::json RecencyOptions::to_json() const {
    nlohmann::json j;
    j["hops"] = hops;
    j["hopPenaltyDays"] = hop_penalty_days;
    j["neighborWindowDays"] = neighbor_window_days;
    j["neighborSampleLimit"] = neighbor_sample_limit;
    return j;
}

RecencyPropagator::RecencyPropagator(RecencyOptions options)
    : options_(options) {}

TimeMap RecencyPropagator::base_times(const NodeMap& nodes, TimePoint now) {
    TimeMap base;
    for (const auto& [path, node] : nodes) {
        if (!node.modified) continue;
        base[path] = std::min(*node.modified, now);
    }
    return base;
}

TimeMap RecencyPropagator::effective_times(const NodeMap& nodes, TimePoint now, bool cascade) const {
    TimeMap base = base_times(nodes, now);
    UndirectedAdjacency adj = undirected_adjacency(nodes);
    if (!cascade) {
        return pass(adj, base, base, now);
    }

    TimeMap current = base;
    for (int i = 0; i < options_.hops; ++i) {
        current = pass(adj, base, current, now);
    }
    return current;
}

TimeMap RecencyPropagator::pass(const UndirectedAdjacency& adj, const TimeMap& base,
                                const TimeMap& current, TimePoint now) const {
    TimeMap next;
    const auto window = days(options_.neighbor_window_days);
    const auto penalty = days(options_.hop_penalty_days);

    for (const auto& [path, neighbors] : adj) {
        std::optional<TimePoint> best;
        auto bit = base.find(path);
        if (bit != base.end()) best = bit->second;
        auto cit = current.find(path);
        if (cit != current.end() && (!best || cit->second > *best)) best = cit->second;

        std::vector<TimePoint> times;
        for (const auto& n : neighbors) {
            auto it = current.find(n);
            if (it != current.end()) times.push_back(std::min(it->second, now));
        }
        std::sort(times.begin(), times.end(), std::greater<TimePoint>());
        if (times.size() > static_cast<size_t>(options_.neighbor_sample_limit)) {
            times.resize(static_cast<size_t>(std::max(0, options_.neighbor_sample_limit)));
        }

        for (const auto& ts : times) {
            if (now - ts > window) continue;
            TimePoint adjusted = ts - penalty;
            if (!best || adjusted > *best) best = adjusted;
        }

        if (best) next[path] = *best;
    }
    return next;
}

double age_in_days(TimePoint ts, TimePoint now) {
    if (ts >= now) return 0.0;
    return std::chrono::duration<double, std::ratio<86400>>(now - ts).count();
}

} // namespace vgraph
