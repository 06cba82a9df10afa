#pragma once

#include <optional>
#include <string>
#include <vector>

namespace morpheus {

// ─── Optimization Metadata ────────────────────────────────────
// Attached to every morph. Composite metadata is always recomputed from
// the constituents, never stored independently of them.

struct OptimizationMetadata {
    bool pure    = true;   // deterministic, no observable side effect
    bool fusible = true;   // may be merged with a neighbour
    double cost  = 1.0;    // relative expense, additive under composition
    std::optional<bool> memoizable;

    bool isMemoizable() const { return memoizable.value_or(true); }

    bool operator==(const OptimizationMetadata& other) const {
        return pure == other.pure && fusible == other.fusible &&
               cost == other.cost && isMemoizable() == other.isMemoizable();
    }
    bool operator!=(const OptimizationMetadata& other) const { return !(*this == other); }
};

/// Throws InvalidMetadataError when cost is negative or not finite.
/// `owner` names the morph in the message.
void validateMetadata(const OptimizationMetadata& metadata, const std::string& owner);

/// Metadata of running `first` then `second`: pure/fusible/memoizable
/// AND, cost sum.
OptimizationMetadata sequenceMetadata(const OptimizationMetadata& first,
                                      const OptimizationMetadata& second);

/// Fold of sequenceMetadata over a list. The empty list yields the
/// identity's metadata (cost 0).
OptimizationMetadata sequenceMetadata(const std::vector<OptimizationMetadata>& parts);

// ─── Morph Options ────────────────────────────────────────────
// Optional overrides supplied by callers. Unset fields fall back to
// whatever default the consuming operation defines.

struct MorphOptions {
    std::optional<std::string> name;
    std::optional<bool> pure;
    std::optional<bool> fusible;
    std::optional<double> cost;
    std::optional<bool> memoizable;

    /// Fill unset fields from `defaults`.
    OptimizationMetadata resolve(const OptimizationMetadata& defaults) const;
};

std::string describeMetadata(const OptimizationMetadata& metadata);

} // namespace morpheus
