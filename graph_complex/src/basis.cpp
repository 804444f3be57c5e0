#include <graph_complex/basis.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace graph_complex {

Basis::Basis(GradingKey key, std::vector<GraphGenerator> generators)
    : key_(key), generators_(std::move(generators)) {
    index_.reserve(generators_.size());
    for (std::size_t i = 0; i < generators_.size(); ++i) {
        if (!index_.emplace(generators_[i].g6, i).second) {
            throw BasisInconsistencyError("duplicate generator " + generators_[i].g6 + " in " +
                                          key_.to_string());
        }
    }
}

std::size_t Basis::index_of(const std::string& g6) const {
    auto it = index_.find(g6);
    return it == index_.end() ? npos : it->second;
}

BasisBuilder::BasisBuilder(std::shared_ptr<const GraphOracle> oracle,
                           std::shared_ptr<const GraphFamily> family)
    : oracle_(std::move(oracle)), family_(std::move(family)) {}

Classification BasisBuilder::classify(const GradingKey& key, const Graph& g) const {
    CanonicalLabeling labeling = oracle_->canonicalize(g, family_->partition(key));
    if (labeling.canonical.num_vertices() != g.num_vertices() ||
        labeling.canonical.num_edges() != g.num_edges()) {
        throw BasisInconsistencyError("canonical form of " + g.to_g6() + " changes its size");
    }

    auto orientation = family_->orientation(key);
    for (const auto& automorphism : labeling.automorphisms) {
        if (!is_permutation(automorphism, g.num_vertices()) || g.relabeled(automorphism) != g) {
            throw BasisInconsistencyError("oracle reported a non-automorphism of " + g.to_g6());
        }
        int sign = orientation->relabel_sign(g, automorphism);
        if (sign != 1 && sign != -1) {
            throw BasisInconsistencyError("orientation sign " + std::to_string(sign) + " for " + g.to_g6());
        }
        if (sign == -1) {
            return Annihilated{labeling.g6, automorphism};
        }
    }
    return GraphGenerator{std::move(labeling.canonical), std::move(labeling.g6)};
}

Basis BasisBuilder::build(const GradingKey& key) const {
    if (key.family() != family_->id()) {
        throw std::invalid_argument("Grading " + key.to_string() + " does not belong to this family");
    }
    if (!family_->is_valid(key)) {
        return Basis(key, {});
    }

    std::vector<Graph> graphs = oracle_->enumerate(family_->enumeration_request(key));

    std::vector<GraphGenerator> generators;
    std::size_t annihilated = 0;
    for (const auto& g : graphs) {
        if (!family_->is_admissible(key, g)) {
            throw BasisInconsistencyError("oracle returned inadmissible graph " + g.to_g6() +
                                          " for " + key.to_string());
        }
        Classification c = classify(key, g);
        if (auto* kept = std::get_if<GraphGenerator>(&c)) {
            generators.push_back(std::move(*kept));
        } else {
            ++annihilated;
        }
    }

    std::sort(generators.begin(), generators.end(),
              [](const GraphGenerator& a, const GraphGenerator& b) { return a.g6 < b.g6; });

    GC_LOG_INFO("basis %s: %zu generators, %zu annihilated by odd automorphisms",
                key.to_string().c_str(), generators.size(), annihilated);
    return Basis(key, std::move(generators));
}

} // namespace graph_complex
