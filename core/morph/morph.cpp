#include "morph/morph.hpp"
#include <algorithm>

namespace morpheus {

namespace {

const MorphPtr& requireMorph(const MorphPtr& morph, const char* role) {
    if (!morph) {
        throw MorphError(std::string("Cannot compose a null morph (") + role + ")");
    }
    return morph;
}

std::string joinNames(const MorphPtr& first, const MorphPtr& second) {
    return first->name() + " → " + second->name();
}

OptimizationMetadata composedMetadata(const std::vector<MorphPtr>& steps,
                                      bool has_post_process,
                                      const MorphOptions& explicit_options) {
    for (const auto& step : steps) {
        requireMorph(step, "step");
    }
    bool all_pure = std::all_of(steps.begin(), steps.end(),
        [](const MorphPtr& s) { return s->metadata().pure; });
    bool post_pure = !has_post_process || explicit_options.pure.value_or(false);

    OptimizationMetadata md;
    md.pure = all_pure && post_pure;
    md.fusible = explicit_options.fusible.value_or(false);

    double cost = has_post_process ? 1.0 : 0.0;
    bool memoizable = true;
    for (const auto& step : steps) {
        cost += step->metadata().cost;
        memoizable = memoizable && step->metadata().isMemoizable();
    }
    md.cost = cost;
    md.memoizable = explicit_options.memoizable.value_or(memoizable);
    return md;
}

} // namespace

const char* kindName(MorphKind kind) {
    switch (kind) {
        case MorphKind::Leaf:      return "leaf";
        case MorphKind::Identity:  return "identity";
        case MorphKind::Composite: return "composite";
        case MorphKind::Composed:  return "composed";
        case MorphKind::Lazy:      return "lazy";
    }
    return "unknown";
}

// ─── Morph ────────────────────────────────────────────────────

Morph::Morph(std::string name, OptimizationMetadata metadata)
    : name_(std::move(name)), metadata_(metadata) {
    validateMetadata(metadata_, name_);
}

MorphPtr Morph::then(MorphPtr next) const {
    return std::make_shared<CompositeMorph>(self(), std::move(next));
}

MorphPtr Morph::self() const {
    MorphPtr handle = weak_from_this().lock();
    if (!handle) {
        throw MorphError("Morph '" + name_ + "' is not owned by a shared_ptr");
    }
    return handle;
}

// ─── SimpleMorph ──────────────────────────────────────────────

SimpleMorph::SimpleMorph(std::string name, MorphFn fn, OptimizationMetadata metadata)
    : Morph(std::move(name), metadata), fn_(std::move(fn)) {
    if (!fn_) {
        throw MorphError("Morph '" + this->name() + "' has no transform function");
    }
}

Value SimpleMorph::apply(const Value& input, Context& ctx) const {
    return fn_(input, ctx);
}

// ─── IdentityMorph ────────────────────────────────────────────

IdentityMorph::IdentityMorph()
    : Morph("IdentityMorph", OptimizationMetadata{true, true, 0.0, true}) {}

// ─── CompositeMorph ───────────────────────────────────────────

CompositeMorph::CompositeMorph(MorphPtr first, MorphPtr second, std::string name)
    : Morph(name.empty()
                ? joinNames(requireMorph(first, "first"), requireMorph(second, "second"))
                : std::move(name),
            sequenceMetadata(requireMorph(first, "first")->metadata(),
                             requireMorph(second, "second")->metadata())),
      first_(std::move(first)),
      second_(std::move(second)) {}

Value CompositeMorph::apply(const Value& input, Context& ctx) const {
    Value intermediate = first_->apply(input, ctx);
    return second_->apply(intermediate, ctx);
}

// ─── ComposedMorph ────────────────────────────────────────────

ComposedMorph::ComposedMorph(std::string name,
                             std::vector<MorphPtr> steps,
                             MorphFn post_process,
                             const MorphOptions& explicit_options)
    : Morph(std::move(name),
            composedMetadata(steps, static_cast<bool>(post_process), explicit_options)),
      steps_(std::move(steps)),
      post_process_(std::move(post_process)) {
    chain_ = identityMorph();
    for (const auto& step : steps_) {
        chain_ = std::make_shared<CompositeMorph>(chain_, step);
    }
}

Value ComposedMorph::apply(const Value& input, Context& ctx) const {
    Value result = chain_->apply(input, ctx);
    if (post_process_) {
        result = post_process_(result, ctx);
    }
    return result;
}

MorphPtr ComposedMorph::then(MorphPtr next) const {
    requireMorph(next, "next");
    std::vector<MorphPtr> steps;
    if (post_process_) {
        steps = {self(), next};
    } else {
        steps = steps_;
        steps.push_back(next);
    }
    return std::make_shared<ComposedMorph>(name() + " → " + next->name(), std::move(steps));
}

// ─── Construction helpers ─────────────────────────────────────

MorphPtr createMorph(std::string name, MorphFn fn, OptimizationMetadata metadata) {
    return std::make_shared<SimpleMorph>(std::move(name), std::move(fn), metadata);
}

MorphPtr identityMorph() {
    return std::make_shared<IdentityMorph>();
}

MorphPtr compose(MorphPtr first, MorphPtr second, std::string name) {
    return std::make_shared<CompositeMorph>(std::move(first), std::move(second), std::move(name));
}

} // namespace morpheus
