#include "graph/components.hpp"
#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_map>

namespace vgraph {

// ==========================================
// UnionFind
// ==========================================

UnionFind::UnionFind(size_t n)
    : parent_(n), size_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), 0);
}

size_t UnionFind::find(size_t x) {
    while (parent_[x] != x) {
        parent_[x] = parent_[parent_[x]];
        x = parent_[x];
    }
    return x;
}

bool UnionFind::unite(size_t a, size_t b) {
    size_t ra = find(a);
    size_t rb = find(b);
    if (ra == rb) return false;
    if (size_[ra] < size_[rb]) std::swap(ra, rb);
    parent_[rb] = ra;
    size_[ra] += size_[rb];
    return true;
}

// ==========================================
// ComponentFinder
// ==========================================

void ComponentFinder::sort_components(std::vector<Component>& components) {
    for (auto& c : components) {
        std::sort(c.begin(), c.end());
    }
    std::sort(components.begin(), components.end(),
              [](const Component& a, const Component& b) {
                  if (a.size() != b.size()) return a.size() > b.size();
                  return a.front() < b.front();
              });
}

std::vector<Component> ComponentFinder::weak_components(const NodeMap& nodes) {
    std::vector<std::string> paths;
    std::unordered_map<std::string, size_t> index;
    for (const auto& [path, node] : nodes) {
        index[path] = paths.size();
        paths.push_back(path);
    }

    UnionFind uf(paths.size());
    for (const auto& [path, node] : nodes) {
        for (const auto& dst : node.neighbors) {
            auto it = index.find(dst);
            if (it != index.end()) {
                uf.unite(index[path], it->second);
            }
        }
    }

    std::map<size_t, Component> groups;
    for (size_t i = 0; i < paths.size(); ++i) {
        groups[uf.find(i)].push_back(paths[i]);
    }

    std::vector<Component> result;
    result.reserve(groups.size());
    for (auto& [root, members] : groups) {
        result.push_back(std::move(members));
    }
    sort_components(result);
    return result;
}

std::vector<Component> ComponentFinder::strong_components(const NodeMap& nodes) {
    const size_t n = nodes.size();
    std::vector<std::string> paths;
    std::unordered_map<std::string, size_t> index;
    for (const auto& [path, node] : nodes) {
        index[path] = paths.size();
        paths.push_back(path);
    }

    std::vector<std::vector<size_t>> out(n);
    for (const auto& [path, node] : nodes) {
        size_t src = index[path];
        for (const auto& dst : node.neighbors) {
            auto it = index.find(dst);
            if (it != index.end()) out[src].push_back(it->second);
        }
    }

    constexpr size_t kUnvisited = static_cast<size_t>(-1);
    std::vector<size_t> disc(n, kUnvisited);
    std::vector<size_t> low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<size_t> stack;
    std::vector<Component> result;
    size_t counter = 0;

    // Explicit DFS frames: (node, next edge to explore)
    std::vector<std::pair<size_t, size_t>> call_stack;

    for (size_t root = 0; root < n; ++root) {
        if (disc[root] != kUnvisited) continue;

        call_stack.emplace_back(root, 0);
        disc[root] = low[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!call_stack.empty()) {
            auto& [v, edge] = call_stack.back();

            if (edge < out[v].size()) {
                size_t w = out[v][edge++];
                if (disc[w] == kUnvisited) {
                    disc[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    call_stack.emplace_back(w, 0);
                } else if (on_stack[w]) {
                    low[v] = std::min(low[v], disc[w]);
                }
                continue;
            }

            size_t finished = v;
            call_stack.pop_back();
            if (!call_stack.empty()) {
                size_t parent = call_stack.back().first;
                low[parent] = std::min(low[parent], low[finished]);
            }

            if (low[finished] == disc[finished]) {
                Component comp;
                size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    comp.push_back(paths[w]);
                } while (w != finished);
                result.push_back(std::move(comp));
            }
        }
    }

    sort_components(result);
    return result;
}

void ComponentFinder::assign(NodeMap& nodes,
                             const std::vector<Component>& weak,
                             const std::vector<Component>& strong) {
    for (size_t i = 0; i < weak.size(); ++i) {
        std::string id = "comp" + std::to_string(i);
        for (const auto& path : weak[i]) {
            auto it = nodes.find(path);
            if (it != nodes.end()) it->second.weak_component = id;
        }
    }
    for (size_t i = 0; i < strong.size(); ++i) {
        std::string id = "scc" + std::to_string(i);
        for (const auto& path : strong[i]) {
            auto it = nodes.find(path);
            if (it != nodes.end()) it->second.strong_component = id;
        }
    }
}

} // namespace vgraph
