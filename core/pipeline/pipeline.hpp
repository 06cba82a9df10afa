#pragma once

#include "morph/morph.hpp"
#include <string>
#include <vector>

namespace morpheus {

/// Expand `root` into its ordered leaf steps, depth-first, left to right.
/// Composite morphs and lazy pipelines are expanded; leaves, identities and
/// composed morphs are emitted as single steps. Throws OptimizationError on
/// a structurally broken composite.
std::vector<MorphPtr> flattenMorph(const MorphPtr& root);

// ─── Lazy Pipeline ────────────────────────────────────────────
// Holds the step list directly instead of nesting composites.
// Metadata: pure/fusible/memoizable AND, cost sum (empty list: cost 0).

class LazyMorphPipeline : public Morph {
public:
    explicit LazyMorphPipeline(std::vector<MorphPtr> steps, std::string name = "Pipeline");

    MorphKind kind() const override { return MorphKind::Lazy; }
    Value apply(const Value& input, Context& ctx) const override;
    std::vector<MorphPtr> components() const override { return steps_; }

    /// Returns a LazyMorphPipeline with `next` appended.
    MorphPtr then(MorphPtr next) const override;

    static std::shared_ptr<const LazyMorphPipeline> identity();

    const std::vector<MorphPtr>& steps() const { return steps_; }

private:
    std::vector<MorphPtr> steps_;
};

// ─── Morph Pipeline ───────────────────────────────────────────
// Named wrapper around one root morph. Value type: copying a pipeline
// shares the root.

class MorphPipeline {
public:
    /// Throws MorphError on a null root.
    explicit MorphPipeline(MorphPtr root, std::string name = "Pipeline");

    Value apply(const Value& input, Context& ctx) const { return root_->apply(input, ctx); }

    /// New pipeline whose root is root()->then(next).
    MorphPipeline then(MorphPtr next) const;

    static MorphPipeline identity();

    /// Left-nested binary composites over `steps`, seeded with the first
    /// step. An empty list gives the identity pipeline.
    static MorphPipeline fromSteps(const std::vector<MorphPtr>& steps,
                                   std::string name = "Pipeline");

    const MorphPtr& root() const { return root_; }
    const std::string& name() const { return name_; }
    const OptimizationMetadata& metadata() const { return root_->metadata(); }

    /// Ordered leaf steps; same traversal the optimizer uses.
    std::vector<MorphPtr> getMorphs() const { return flattenMorph(root_); }

    std::vector<std::string> stepNames() const;

private:
    MorphPtr root_;
    std::string name_;
};

} // namespace morpheus
