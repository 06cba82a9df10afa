#include "pipeline/pipeline.hpp"

namespace morpheus {

std::vector<MorphPtr> flattenMorph(const MorphPtr& root) {
    std::vector<MorphPtr> steps;
    std::vector<MorphPtr> work;
    work.push_back(root);

    while (!work.empty()) {
        MorphPtr current = std::move(work.back());
        work.pop_back();
        if (!current) {
            throw OptimizationError("Cannot flatten a null morph");
        }

        switch (current->kind()) {
            case MorphKind::Leaf:
            case MorphKind::Identity:
            case MorphKind::Composed:
                steps.push_back(std::move(current));
                break;

            case MorphKind::Composite: {
                std::vector<MorphPtr> parts = current->components();
                if (parts.size() != 2) {
                    throw OptimizationError("Composite '" + current->name() +
                                            "' does not have exactly two children");
                }
                // Stack: push right first so the left child is expanded first.
                work.push_back(parts[1]);
                work.push_back(parts[0]);
                break;
            }

            case MorphKind::Lazy: {
                std::vector<MorphPtr> parts = current->components();
                for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
                    work.push_back(*it);
                }
                break;
            }

            default:
                throw OptimizationError("Morph '" + current->name() +
                                        "' has an unrecognized kind");
        }
    }
    return steps;
}

// ─── LazyMorphPipeline ────────────────────────────────────────

namespace {

OptimizationMetadata lazyMetadata(const std::vector<MorphPtr>& steps) {
    std::vector<OptimizationMetadata> parts;
    parts.reserve(steps.size());
    for (const auto& step : steps) {
        if (!step) {
            throw MorphError("Lazy pipeline cannot hold a null step");
        }
        parts.push_back(step->metadata());
    }
    return sequenceMetadata(parts);
}

} // namespace

LazyMorphPipeline::LazyMorphPipeline(std::vector<MorphPtr> steps, std::string name)
    : Morph(std::move(name), lazyMetadata(steps)), steps_(std::move(steps)) {}

Value LazyMorphPipeline::apply(const Value& input, Context& ctx) const {
    Value current = input;
    for (const auto& step : steps_) {
        current = step->apply(current, ctx);
    }
    return current;
}

MorphPtr LazyMorphPipeline::then(MorphPtr next) const {
    if (!next) {
        throw MorphError("Cannot append a null morph to '" + name() + "'");
    }
    std::vector<MorphPtr> steps = steps_;
    std::string name = this->name() + " → " + next->name();
    steps.push_back(std::move(next));
    return std::make_shared<LazyMorphPipeline>(std::move(steps), std::move(name));
}

std::shared_ptr<const LazyMorphPipeline> LazyMorphPipeline::identity() {
    return std::make_shared<LazyMorphPipeline>(std::vector<MorphPtr>{}, "Identity");
}

// ─── MorphPipeline ────────────────────────────────────────────

MorphPipeline::MorphPipeline(MorphPtr root, std::string name)
    : root_(std::move(root)), name_(std::move(name)) {
    if (!root_) {
        throw MorphError("Pipeline '" + name_ + "' has no root morph");
    }
}

MorphPipeline MorphPipeline::then(MorphPtr next) const {
    if (!next) {
        throw MorphError("Cannot append a null morph to pipeline '" + name_ + "'");
    }
    std::string name = name_ + " → " + next->name();
    return MorphPipeline(root_->then(std::move(next)), std::move(name));
}

MorphPipeline MorphPipeline::identity() {
    return MorphPipeline(identityMorph(), "IdentityPipeline");
}

MorphPipeline MorphPipeline::fromSteps(const std::vector<MorphPtr>& steps, std::string name) {
    if (steps.empty()) {
        return MorphPipeline(identityMorph(), std::move(name));
    }
    // Plain binary composites so flattening the result yields `steps` again.
    MorphPtr root = steps.front();
    for (size_t i = 1; i < steps.size(); i++) {
        root = compose(root, steps[i]);
    }
    return MorphPipeline(std::move(root), std::move(name));
}

std::vector<std::string> MorphPipeline::stepNames() const {
    std::vector<std::string> names;
    for (const auto& step : getMorphs()) {
        names.push_back(step->name());
    }
    return names;
}

} // namespace morpheus
