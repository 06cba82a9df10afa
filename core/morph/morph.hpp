#pragma once

#include "morph/errors.hpp"
#include "morph/metadata.hpp"
#include "morph/value.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace morpheus {

class Morph;

/// Morphs are immutable and shared; every holder keeps a const handle.
using MorphPtr = std::shared_ptr<const Morph>;

/// Structural tag used by flattening instead of runtime type checks.
enum class MorphKind {
    Leaf,        // opaque function
    Identity,    // no-op, stripped by the optimizer
    Composite,   // exactly two children, run in order
    Composed,    // ordered steps plus optional post-processing (opaque to flattening)
    Lazy,        // ordered steps, expanded by flattening
};

const char* kindName(MorphKind kind);

// ─── Morph ────────────────────────────────────────────────────
// M : (input, context) → output
// Base class for every transform unit. Must not mutate its input or hold
// mutable state; anything stateful belongs in the caller's context.
// Instances must be owned by a std::shared_ptr (then() relies on it).

class Morph : public std::enable_shared_from_this<Morph> {
public:
    /// Throws InvalidMetadataError on malformed metadata.
    Morph(std::string name, OptimizationMetadata metadata);
    virtual ~Morph() = default;

    Morph(const Morph&) = delete;
    Morph& operator=(const Morph&) = delete;

    const std::string& name() const { return name_; }
    const OptimizationMetadata& metadata() const { return metadata_; }

    virtual MorphKind kind() const = 0;

    /// Transform `input`. Errors raised by the underlying function
    /// propagate unchanged.
    virtual Value apply(const Value& input, Context& ctx) const = 0;

    /// Direct children for composite kinds, empty for leaves.
    virtual std::vector<MorphPtr> components() const { return {}; }

    /// Sequential composition: this, then `next`.
    virtual MorphPtr then(MorphPtr next) const;

protected:
    /// Shared handle to this morph; throws MorphError when the morph is
    /// not owned by a shared_ptr.
    MorphPtr self() const;

private:
    std::string name_;
    OptimizationMetadata metadata_;
};

// ─── Simple Morph ─────────────────────────────────────────────

class SimpleMorph : public Morph {
public:
    SimpleMorph(std::string name, MorphFn fn, OptimizationMetadata metadata = {});

    MorphKind kind() const override { return MorphKind::Leaf; }
    Value apply(const Value& input, Context& ctx) const override;

private:
    MorphFn fn_;
};

// ─── Identity Morph ───────────────────────────────────────────
// Neutral element of composition. Metadata fixed at {pure, fusible, cost 0}.

class IdentityMorph : public Morph {
public:
    IdentityMorph();

    MorphKind kind() const override { return MorphKind::Identity; }
    Value apply(const Value& input, Context&) const override { return input; }
};

// ─── Composite Morph ──────────────────────────────────────────
// second(first(x)). pure/fusible AND, cost sum.

class CompositeMorph : public Morph {
public:
    /// Empty `name` yields "<first> → <second>". Null children throw MorphError.
    CompositeMorph(MorphPtr first, MorphPtr second, std::string name = "");

    MorphKind kind() const override { return MorphKind::Composite; }
    Value apply(const Value& input, Context& ctx) const override;
    std::vector<MorphPtr> components() const override { return {first_, second_}; }

    const MorphPtr& first() const { return first_; }
    const MorphPtr& second() const { return second_; }

private:
    MorphPtr first_;
    MorphPtr second_;
};

// ─── Composed Morph ───────────────────────────────────────────
// Ordered steps folded into composites from identity, with an optional
// post-processing function applied to the final value.
//
//   pure    = all steps pure && (no post-process || explicit pure)
//   fusible = explicit fusible only
//   cost    = Σ step cost + (post-process ? 1 : 0)

class ComposedMorph : public Morph {
public:
    ComposedMorph(std::string name,
                  std::vector<MorphPtr> steps,
                  MorphFn post_process = nullptr,
                  const MorphOptions& explicit_options = {});

    MorphKind kind() const override { return MorphKind::Composed; }
    Value apply(const Value& input, Context& ctx) const override;
    std::vector<MorphPtr> components() const override { return steps_; }

    /// Stays a ComposedMorph: `next` is appended, post-processing cleared.
    /// A receiver with a post-process becomes the first step of the result.
    MorphPtr then(MorphPtr next) const override;

    const std::vector<MorphPtr>& steps() const { return steps_; }
    bool hasPostProcess() const { return static_cast<bool>(post_process_); }

private:
    std::vector<MorphPtr> steps_;
    MorphFn post_process_;
    MorphPtr chain_;
};

// ─── Construction helpers ─────────────────────────────────────

/// Erased form: `fn` works on Values directly.
MorphPtr createMorph(std::string name, MorphFn fn, OptimizationMetadata metadata = {});

/// Typed form: `fn` takes (const In&) or (const In&, Context&) and returns
/// something convertible to Out.
template <typename In, typename Out, typename Fn>
MorphPtr makeMorph(std::string name, Fn fn, OptimizationMetadata metadata = {}) {
    MorphFn erased = detail::liftTyped<In, Out>(std::move(fn), name);
    return createMorph(std::move(name), std::move(erased), metadata);
}

MorphPtr identityMorph();

/// first, then second, as a binary composite.
MorphPtr compose(MorphPtr first, MorphPtr second, std::string name = "");

} // namespace morpheus
