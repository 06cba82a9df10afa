#include "pipeline/optimizer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>

namespace morpheus {

namespace {

bool costNotGreater(double after, double before) {
    // Fusion re-associates the sums, allow rounding noise only.
    double tolerance = 1e-9 * std::max(1.0, std::fabs(before));
    return after <= before + tolerance;
}

std::mutex& defaultsMutex() {
    static std::mutex mutex;
    return mutex;
}

OptimizerOptions& defaultOptions() {
    static OptimizerOptions options;
    return options;
}

} // namespace

MorphPtr PipelineOptimizer::fuse(const MorphPtr& first, const MorphPtr& second) {
    OptimizationMetadata md = sequenceMetadata(first->metadata(), second->metadata());
    md.fusible = true;

    MorphPtr a = first;
    MorphPtr b = second;
    return createMorph(
        first->name() + " ⊕ " + second->name(),
        [a, b](const Value& input, Context& ctx) -> Value {
            return b->apply(a->apply(input, ctx), ctx);
        },
        md);
}

std::vector<MorphPtr> PipelineOptimizer::optimizeSteps(const std::vector<MorphPtr>& steps,
                                                       OptimizationReport* report) const {
    std::vector<MorphPtr> kept;
    kept.reserve(steps.size());
    size_t identities_removed = 0;

    for (const auto& step : steps) {
        if (options_.strip_identity && step->kind() == MorphKind::Identity) {
            identities_removed++;
            continue;
        }
        kept.push_back(step);
    }
    // A pipeline always resolves to at least one unit.
    if (kept.empty() && identities_removed > 0) {
        kept.push_back(identityMorph());
        identities_removed--;
    }

    std::vector<MorphPtr> optimized;
    optimized.reserve(kept.size());
    size_t fusions = 0;

    for (size_t i = 0; i < kept.size(); i++) {
        const MorphPtr& current = kept[i];
        bool can_fuse = options_.fuse && i + 1 < kept.size() &&
                        current->metadata().fusible && kept[i + 1]->metadata().fusible;
        if (can_fuse) {
            optimized.push_back(fuse(current, kept[i + 1]));
            fusions++;
            i++;  // skip the partner, do not rescan into the fused unit
        } else {
            optimized.push_back(current);
        }
    }

    if (report) {
        report->steps_before = steps.size();
        report->steps_after = optimized.size();
        report->identities_removed = identities_removed;
        report->fusions = fusions;
    }
    return optimized;
}

MorphPipeline PipelineOptimizer::optimize(const MorphPipeline& pipeline,
                                          OptimizationReport* report) const {
    std::vector<MorphPtr> steps = flattenMorph(pipeline.root());

    OptimizationReport local;
    std::vector<MorphPtr> optimized = optimizeSteps(steps, &local);
    MorphPipeline result = MorphPipeline::fromSteps(optimized, pipeline.name() + "-optimized");

    local.cost_before = pipeline.metadata().cost;
    local.cost_after = result.metadata().cost;
    if (!costNotGreater(local.cost_after, local.cost_before)) {
        std::ostringstream oss;
        oss << "Optimized pipeline '" << result.name() << "' costs " << local.cost_after
            << ", more than the input's " << local.cost_before;
        throw OptimizationError(oss.str());
    }

    if (Logger::instance().shouldLog(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << "Optimized '" << pipeline.name() << "': " << local.steps_before
            << " → " << local.steps_after << " steps, "
            << local.identities_removed << " identities removed, "
            << local.fusions << " fusions, cost " << local.cost_before
            << " → " << local.cost_after;
        MORPHEUS_LOG_DEBUG(oss.str());
    }

    if (report) *report = local;
    return result;
}

OptimizerOptions defaultOptimizerOptions() {
    std::lock_guard<std::mutex> lock(defaultsMutex());
    return defaultOptions();
}

void setDefaultOptimizerOptions(const OptimizerOptions& options) {
    std::lock_guard<std::mutex> lock(defaultsMutex());
    defaultOptions() = options;
}

MorphPipeline optimizePipeline(const MorphPipeline& pipeline) {
    return PipelineOptimizer(defaultOptimizerOptions()).optimize(pipeline);
}

MorphPipeline createOptimizedPipeline(const std::vector<MorphPtr>& steps, const std::string& name) {
    MorphPipeline pipeline(identityMorph(), name);
    for (const auto& step : steps) {
        pipeline = pipeline.then(step);
    }
    MorphPipeline optimized = PipelineOptimizer(defaultOptimizerOptions()).optimize(pipeline);
    return MorphPipeline(optimized.root(), name);
}

} // namespace morpheus
