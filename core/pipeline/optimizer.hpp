#pragma once

#include "pipeline/pipeline.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace morpheus {

struct OptimizerOptions {
    bool strip_identity = true;  // drop identity steps (one survives if alone)
    bool fuse = true;            // merge adjacent fusible pairs
};

/// What a single optimize() call did.
struct OptimizationReport {
    size_t steps_before = 0;
    size_t steps_after = 0;
    size_t identities_removed = 0;
    size_t fusions = 0;
    double cost_before = 0.0;
    double cost_after = 0.0;
};

// ─── Pipeline Optimizer ───────────────────────────────────────
// flatten → strip identities → fuse adjacent fusible pairs → rebuild.
//
// Fusion is pairwise and does not rescan into a fused unit, so four
// fusible steps a b c d become (a ⊕ b)(c ⊕ d). Only the declared `fusible`
// flag is consulted. A fused unit fails as a whole: the intermediate value
// between its halves is not observable, so steps whose partial effects
// matter must not be declared fusible.

class PipelineOptimizer {
public:
    explicit PipelineOptimizer(OptimizerOptions options = {}) : options_(options) {}

    /// Always returns the rebuilt pipeline, named "<name>-optimized".
    /// Throws OptimizationError if flattening fails or the rebuilt
    /// pipeline would cost more than the input.
    MorphPipeline optimize(const MorphPipeline& pipeline,
                           OptimizationReport* report = nullptr) const;

    /// The step-list transformation on its own (after flattening).
    std::vector<MorphPtr> optimizeSteps(const std::vector<MorphPtr>& steps,
                                        OptimizationReport* report = nullptr) const;

    const OptimizerOptions& options() const { return options_; }

    /// Synthetic unit running `first` then `second` as one function.
    static MorphPtr fuse(const MorphPtr& first, const MorphPtr& second);

private:
    OptimizerOptions options_;
};

/// Process-wide options read by optimizePipeline and createOptimizedPipeline.
/// applyConfig() sets them from EngineConfig::optimizer.
OptimizerOptions defaultOptimizerOptions();
void setDefaultOptimizerOptions(const OptimizerOptions& options);

/// Optimize with defaultOptimizerOptions().
MorphPipeline optimizePipeline(const MorphPipeline& pipeline);

/// Fold `steps` into a pipeline seeded with identity, then optimize it
/// with defaultOptimizerOptions().
MorphPipeline createOptimizedPipeline(const std::vector<MorphPtr>& steps,
                                      const std::string& name = "OptimizedPipeline");

} // namespace morpheus
