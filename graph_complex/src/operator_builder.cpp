#include <graph_complex/operator_builder.hpp>
#include <graph_complex/errors.hpp>
#include <graph_complex/log.hpp>
#include <map>
#include <stdexcept>
#include <variant>

namespace graph_complex {

std::string OperatorId::to_string() const {
    return std::string(operator_name(kind)) + ":" + domain.to_string() + "->" + target.to_string();
}

OperatorBuilder::OperatorBuilder(std::shared_ptr<const GraphOracle> oracle,
                                 std::shared_ptr<const GraphFamily> family)
    : oracle_(oracle), family_(family), classifier_(oracle, family) {}

OperatorId OperatorBuilder::operator_id(OperatorKind kind, const GradingKey& domain) const {
    return OperatorId{kind, domain, family_->target_of(kind, domain)};
}

SparseMatrix OperatorBuilder::build(OperatorKind kind, const Basis& domain, const Basis& target) const {
    const GradingKey& dkey = domain.key();
    const GradingKey& tkey = target.key();
    if (family_->target_of(kind, dkey) != tkey) {
        throw std::invalid_argument(tkey.to_string() + " is not the " + operator_name(kind) +
                                    " target of " + dkey.to_string());
    }
    if (!family_->supports(kind, dkey)) {
        throw std::invalid_argument(std::string(operator_name(kind)) + " is not defined on " +
                                    dkey.to_string());
    }

    SparseMatrix matrix(target.size(), domain.size());
    if (!family_->is_valid(dkey) || !family_->is_valid(tkey) || domain.empty() || target.empty()) {
        return matrix;
    }

    const auto orientation = family_->orientation(tkey);
    const auto partition = family_->partition(tkey);

    for (std::size_t col = 0; col < domain.size(); ++col) {
        const GraphGenerator& source = domain[col];

        // canonical graph6 -> (accumulated coefficient, canonical graph)
        std::map<std::string, std::pair<std::int64_t, Graph>> images;
        for (const auto& image : family_->apply(kind, dkey, source.graph)) {
            CanonicalLabeling labeling;
            try {
                labeling = oracle_->canonicalize(image.graph, partition);
            } catch (const std::invalid_argument& e) {
                throw OperatorConstructionError("cannot canonicalize image of " + source.g6 + ": " + e.what());
            }
            int sign = orientation->relabel_sign(image.graph, labeling.labeling) * image.sign;

            auto it = images.find(labeling.g6);
            if (it == images.end()) {
                images.emplace(labeling.g6, std::make_pair(std::int64_t(sign), std::move(labeling.canonical)));
            } else {
                it->second.first += sign;
            }
        }

        for (const auto& [g6, entry] : images) {
            if (entry.first == 0) continue;

            std::size_t row = target.index_of(g6);
            if (row != Basis::npos) {
                matrix.add(row, col, entry.first);
                continue;
            }

            if (!family_->is_admissible(tkey, entry.second)) {
                GC_DEBUG_LOG("image %s of %s is not admissible in %s", g6.c_str(), source.g6.c_str(),
                             tkey.to_string().c_str());
                continue;
            }
            Classification c = classifier_.classify(tkey, entry.second);
            if (std::holds_alternative<Annihilated>(c)) {
                continue;
            }
            throw OperatorConstructionError("image " + g6 + " of " + source.g6 + " is missing from the basis of " +
                                            tkey.to_string());
        }
    }

    GC_LOG_INFO("operator %s %s: %zux%zu matrix, %zu entries", operator_name(kind), dkey.to_string().c_str(),
                matrix.rows(), matrix.cols(), matrix.nnz());
    return matrix;
}

} // namespace graph_complex
