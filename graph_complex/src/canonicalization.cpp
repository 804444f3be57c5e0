#include <graph_complex/canonicalization.hpp>
#include <graph_complex/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace graph_complex {

namespace {

inline int popcount64(std::uint64_t x) {
    return __builtin_popcountll(x);
}

inline std::uint64_t bit(VertexId v) {
    return std::uint64_t(1) << v;
}

std::vector<std::uint64_t> adjacency_masks(const Graph& g) {
    std::vector<std::uint64_t> adj(g.num_vertices(), 0);
    for (const auto& e : g.edges()) {
        adj[e.u] |= bit(e.v);
        adj[e.v] |= bit(e.u);
    }
    return adj;
}

} // namespace

bool Canonicalizer::are_twins(const std::vector<std::uint64_t>& adjacency, VertexId a, VertexId b) {
    return (adjacency[a] & ~bit(b)) == (adjacency[b] & ~bit(a));
}

// Split every cell by the number of neighbours its vertices have in each cell,
// until the partition is equitable. Sub-cells replace their parent in place,
// ordered by signature, so the result depends only on the labeled structure.
void Canonicalizer::refine(const std::vector<std::uint64_t>& adjacency, Cells& cells) const {
    struct Entry {
        std::vector<int> signature;
        VertexId vertex;
    };

    bool split = true;
    while (split) {
        split = false;

        std::vector<std::uint64_t> masks(cells.size(), 0);
        for (std::size_t j = 0; j < cells.size(); ++j) {
            for (VertexId v : cells[j]) masks[j] |= bit(v);
        }

        Cells next;
        next.reserve(cells.size() + 4);
        for (const auto& cell : cells) {
            if (cell.size() == 1) {
                next.push_back(cell);
                continue;
            }

            std::vector<Entry> entries;
            entries.reserve(cell.size());
            for (VertexId v : cell) {
                Entry entry;
                entry.vertex = v;
                entry.signature.reserve(masks.size());
                for (std::uint64_t m : masks) {
                    entry.signature.push_back(popcount64(adjacency[v] & m));
                }
                entries.push_back(std::move(entry));
            }
            std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
                if (a.signature != b.signature) return a.signature < b.signature;
                return a.vertex < b.vertex;
            });

            std::size_t start = 0;
            for (std::size_t i = 1; i <= entries.size(); ++i) {
                if (i == entries.size() || entries[i].signature != entries[start].signature) {
                    std::vector<VertexId> group;
                    group.reserve(i - start);
                    for (std::size_t k = start; k < i; ++k) group.push_back(entries[k].vertex);
                    next.push_back(std::move(group));
                    start = i;
                }
            }
            if (entries.front().signature != entries.back().signature) {
                split = true;
            }
        }
        cells = std::move(next);
    }
}

void Canonicalizer::visit_leaf(SearchState& state, const Cells& cells) const {
    const auto& adjacency = *state.adjacency;
    Permutation labeling(adjacency.size());
    for (std::size_t i = 0; i < cells.size(); ++i) {
        labeling[cells[i].front()] = static_cast<VertexId>(i);
    }

    Certificate certificate(adjacency.size(), 0);
    for (std::size_t v = 0; v < adjacency.size(); ++v) {
        std::uint64_t mask = 0;
        std::uint64_t rest = adjacency[v];
        while (rest) {
            int w = __builtin_ctzll(rest);
            rest &= rest - 1;
            mask |= bit(labeling[static_cast<std::size_t>(w)]);
        }
        certificate[labeling[v]] = mask;
    }

    if (!state.have_best || certificate < state.best_certificate) {
        state.best_certificate = std::move(certificate);
        state.best_labeling = std::move(labeling);
        state.equivalent_leaves.clear();
        state.have_best = true;
    } else if (certificate == state.best_certificate) {
        state.equivalent_leaves.push_back(std::move(labeling));
    }
}

void Canonicalizer::search(SearchState& state, Cells cells) const {
    refine(*state.adjacency, cells);

    std::size_t target = cells.size();
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i].size() > 1) {
            target = i;
            break;
        }
    }
    if (target == cells.size()) {
        visit_leaf(state, cells);
        return;
    }

    const std::vector<VertexId> candidates = cells[target];
    std::vector<VertexId> explored;
    for (VertexId v : candidates) {
        bool pruned = false;
        for (VertexId w : explored) {
            if (are_twins(*state.adjacency, v, w)) {
                Permutation swap(state.adjacency->size());
                for (std::size_t i = 0; i < swap.size(); ++i) swap[i] = static_cast<VertexId>(i);
                std::swap(swap[v], swap[w]);
                state.twin_generators.push_back(std::move(swap));
                pruned = true;
                break;
            }
        }
        if (pruned) continue;

        Cells child;
        child.reserve(cells.size() + 1);
        for (std::size_t i = 0; i < target; ++i) child.push_back(cells[i]);
        child.push_back({v});
        std::vector<VertexId> rest;
        rest.reserve(candidates.size() - 1);
        for (VertexId x : candidates) {
            if (x != v) rest.push_back(x);
        }
        child.push_back(std::move(rest));
        for (std::size_t i = target + 1; i < cells.size(); ++i) child.push_back(cells[i]);

        search(state, std::move(child));
        explored.push_back(v);
    }
}

CanonicalLabeling Canonicalizer::canonicalize(const Graph& g, const Partition& partition) const {
    const std::size_t n = g.num_vertices();
    if (n > MAX_GRAPH_VERTICES) {
        throw std::invalid_argument("Cannot canonicalize graphs with more than 62 vertices");
    }

    Cells cells;
    if (partition.empty()) {
        if (n > 0) {
            std::vector<VertexId> all(n);
            for (std::size_t i = 0; i < n; ++i) all[i] = static_cast<VertexId>(i);
            cells.push_back(std::move(all));
        }
    } else {
        std::vector<bool> seen(n, false);
        std::size_t covered = 0;
        for (const auto& cls : partition) {
            for (VertexId v : cls) {
                if (v >= n || seen[v]) {
                    throw std::invalid_argument("Colour classes do not partition the vertex set");
                }
                seen[v] = true;
                ++covered;
            }
            if (!cls.empty()) cells.push_back(cls);
        }
        if (covered != n) {
            throw std::invalid_argument("Colour classes do not cover the vertex set");
        }
    }

    CanonicalLabeling result;
    if (n == 0) {
        result.canonical = g;
        result.g6 = g.to_g6();
        return result;
    }

    auto adjacency = adjacency_masks(g);
    SearchState state;
    state.adjacency = &adjacency;
    search(state, std::move(cells));

    result.labeling = state.best_labeling;
    result.canonical = g.relabeled(result.labeling);
    result.g6 = result.canonical.to_g6();

    Permutation inverse_best = inverse_permutation(state.best_labeling);
    for (const auto& leaf : state.equivalent_leaves) {
        Permutation automorphism(n);
        bool identity = true;
        for (std::size_t v = 0; v < n; ++v) {
            automorphism[v] = inverse_best[leaf[v]];
            if (automorphism[v] != v) identity = false;
        }
        if (!identity) result.automorphisms.push_back(std::move(automorphism));
    }
    for (auto& swap : state.twin_generators) {
        result.automorphisms.push_back(std::move(swap));
    }
    std::sort(result.automorphisms.begin(), result.automorphisms.end());
    result.automorphisms.erase(std::unique(result.automorphisms.begin(), result.automorphisms.end()),
                               result.automorphisms.end());

    GC_DEBUG_LOG("canonicalize %s -> %s (%zu automorphism generators)",
                 g.to_g6().c_str(), result.g6.c_str(), result.automorphisms.size());
    return result;
}

} // namespace graph_complex
