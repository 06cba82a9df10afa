#pragma once

#include "morph/morph.hpp"
#include "registry/morph_registry.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace morpheus {

// ─── Fluent Pipeline ──────────────────────────────────────────
// Accumulates steps and finalizes them into one morph.
//
//   auto morph = createPipeline("normalize", registry)
//       .map<int, int>([](int x) { return x * 2; })
//       .filter<int>([](int x) { return x > 0; })
//       .pipeByName("clamp")
//       .build({"Doubles and clamps"});
//
// Typed helpers take the payload type as template argument; the
// callables may accept (const T&) or (const T&, Context&). With the
// default T = Value they see the raw payload.

class FluentPipeline {
public:
    using Predicate = std::function<bool(const Value&, Context&)>;

    explicit FluentPipeline(std::string name,
                            std::shared_ptr<MorphRegistry> registry = globalRegistry(),
                            MorphPtr initial = nullptr);

    /// Append a morph as is.
    FluentPipeline& pipe(MorphPtr morph);

    /// Append a registered morph. Throws NotFoundError when absent.
    FluentPipeline& pipeByName(const std::string& morph_name);

    /// Pass the input through when `predicate` holds; otherwise raise
    /// FilterRejectedError so no later step runs.
    template <typename T = Value, typename Pred>
    FluentPipeline& filter(Pred predicate) {
        return addFilter(detail::liftPredicate<T>(std::move(predicate), nextName("Filter")));
    }

    /// Run `morph` only when `predicate` holds; otherwise pass through.
    template <typename T = Value, typename Pred>
    FluentPipeline& conditionally(Pred predicate, MorphPtr morph) {
        return addConditional(
            detail::liftPredicate<T>(std::move(predicate), nextName("Conditional")),
            std::move(morph));
    }

    /// Inline transform. Metadata defaults {pure, fusible, cost 1,
    /// memoizable}, each overridable through `options`.
    template <typename In = Value, typename Out = Value, typename Fn>
    FluentPipeline& map(Fn transform, const MorphOptions& options = {}) {
        std::string name = options.name.value_or(nextName("Map"));
        MorphFn erased = detail::liftTyped<In, Out>(std::move(transform), name);
        return addMap(std::move(name), std::move(erased), options);
    }

    /// Dispatch to `when_true` or `when_false` on `predicate`.
    /// cost = 1 + max(branch costs); never pure, fusible or memoizable.
    template <typename T = Value, typename Pred>
    FluentPipeline& branch(Pred predicate, MorphPtr when_true, MorphPtr when_false) {
        return addBranch(detail::liftPredicate<T>(std::move(predicate), nextName("Branch")),
                         std::move(when_true), std::move(when_false));
    }

    /// Finalize into one morph named after the pipeline. Multi-step builds
    /// are registered with their composition trace; zero- and one-step
    /// builds are not.
    MorphPtr build(MorphDescriptor descriptor = {});

    /// Run the accumulated steps without building or registering.
    Value apply(const Value& input, Context& ctx) const;

    /// Metadata build() would give a multi-step morph.
    OptimizationMetadata metadata() const;

    /// Human-readable step listing with costs.
    std::string describe() const;

    const std::string& name() const { return name_; }
    size_t size() const { return steps_.size(); }
    const std::vector<MorphPtr>& steps() const { return steps_; }
    std::vector<std::string> stepNames() const;

    /// Start a pipeline from a registered morph. Throws NotFoundError.
    static FluentPipeline fromName(const std::string& pipeline_name,
                                   const std::string& morph_name,
                                   std::shared_ptr<MorphRegistry> registry = globalRegistry());

private:
    std::string nextName(const char* prefix) const;

    FluentPipeline& addFilter(Predicate predicate);
    FluentPipeline& addConditional(Predicate predicate, MorphPtr morph);
    FluentPipeline& addMap(std::string name, MorphFn transform, const MorphOptions& options);
    FluentPipeline& addBranch(Predicate predicate, MorphPtr when_true, MorphPtr when_false);

    std::string name_;
    std::shared_ptr<MorphRegistry> registry_;
    std::vector<MorphPtr> steps_;
};

FluentPipeline createPipeline(const std::string& name);
FluentPipeline createPipeline(const std::string& name, std::shared_ptr<MorphRegistry> registry);

} // namespace morpheus
