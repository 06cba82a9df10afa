#include "builder/fluent_pipeline.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <sstream>

namespace morpheus {

namespace {

Value runSteps(const std::vector<MorphPtr>& steps, const Value& input, Context& ctx) {
    Value result = input;
    for (const auto& step : steps) {
        result = step->apply(result, ctx);
    }
    return result;
}

const MorphPtr& requireStep(const MorphPtr& morph, const std::string& pipeline) {
    if (!morph) {
        throw MorphError("Cannot add a null morph to pipeline '" + pipeline + "'");
    }
    return morph;
}

} // namespace

FluentPipeline::FluentPipeline(std::string name,
                               std::shared_ptr<MorphRegistry> registry,
                               MorphPtr initial)
    : name_(std::move(name)), registry_(std::move(registry)) {
    if (!registry_) {
        throw MorphError("Pipeline '" + name_ + "' needs a registry");
    }
    if (initial) {
        steps_.push_back(std::move(initial));
    }
}

std::string FluentPipeline::nextName(const char* prefix) const {
    return std::string(prefix) + "_" + std::to_string(steps_.size());
}

FluentPipeline& FluentPipeline::pipe(MorphPtr morph) {
    steps_.push_back(requireStep(morph, name_));
    return *this;
}

FluentPipeline& FluentPipeline::pipeByName(const std::string& morph_name) {
    MorphPtr morph = registry_->get(morph_name);
    if (!morph) {
        MORPHEUS_LOG_WARNING("Pipeline '" + name_ + "': morph '" + morph_name +
                             "' not found in registry");
        throw NotFoundError(morph_name);
    }
    steps_.push_back(std::move(morph));
    return *this;
}

FluentPipeline& FluentPipeline::addFilter(Predicate predicate) {
    std::string name = nextName("Filter");
    OptimizationMetadata md{false, false, 0.1, false};
    steps_.push_back(createMorph(
        name,
        [predicate = std::move(predicate), name](const Value& input, Context& ctx) -> Value {
            if (!predicate(input, ctx)) {
                throw FilterRejectedError(name);
            }
            return input;
        },
        md));
    return *this;
}

FluentPipeline& FluentPipeline::addConditional(Predicate predicate, MorphPtr morph) {
    requireStep(morph, name_);
    OptimizationMetadata md;
    md.pure = morph->metadata().pure;
    md.fusible = false;
    md.cost = 0.1 + morph->metadata().cost;
    md.memoizable = morph->metadata().isMemoizable();

    steps_.push_back(createMorph(
        nextName("Conditional"),
        [predicate = std::move(predicate), morph](const Value& input, Context& ctx) -> Value {
            if (predicate(input, ctx)) {
                return morph->apply(input, ctx);
            }
            return input;
        },
        md));
    return *this;
}

FluentPipeline& FluentPipeline::addMap(std::string name, MorphFn transform,
                                       const MorphOptions& options) {
    OptimizationMetadata defaults{true, true, 1.0, true};
    steps_.push_back(createMorph(std::move(name), std::move(transform),
                                 options.resolve(defaults)));
    return *this;
}

FluentPipeline& FluentPipeline::addBranch(Predicate predicate, MorphPtr when_true,
                                          MorphPtr when_false) {
    requireStep(when_true, name_);
    requireStep(when_false, name_);
    OptimizationMetadata md{false, false,
                            1.0 + std::max(when_true->metadata().cost,
                                           when_false->metadata().cost),
                            false};

    steps_.push_back(createMorph(
        nextName("Branch"),
        [predicate = std::move(predicate), when_true, when_false](
            const Value& input, Context& ctx) -> Value {
            if (predicate(input, ctx)) {
                return when_true->apply(input, ctx);
            }
            return when_false->apply(input, ctx);
        },
        md));
    return *this;
}

OptimizationMetadata FluentPipeline::metadata() const {
    std::vector<OptimizationMetadata> parts;
    parts.reserve(steps_.size());
    for (const auto& step : steps_) {
        parts.push_back(step->metadata());
    }
    return sequenceMetadata(parts);
}

MorphPtr FluentPipeline::build(MorphDescriptor descriptor) {
    if (steps_.empty()) {
        return createMorph(
            name_, [](const Value& input, Context&) -> Value { return input; },
            OptimizationMetadata{true, true, 0.0, true});
    }

    if (steps_.size() == 1) {
        MorphPtr only = steps_.front();
        return createMorph(
            name_,
            [only](const Value& input, Context& ctx) -> Value { return only->apply(input, ctx); },
            only->metadata());
    }

    std::vector<MorphPtr> steps = steps_;
    MorphPtr built = createMorph(
        name_,
        [steps](const Value& input, Context& ctx) -> Value { return runSteps(steps, input, ctx); },
        metadata());

    if (descriptor.description.empty()) descriptor.description = "Pipeline: " + name_;
    if (descriptor.category.empty()) descriptor.category = "pipeline";
    descriptor.composition_type = "fluent-pipeline";
    descriptor.composition = stepNames();

    registry_->registerMorph(built, std::move(descriptor));
    return built;
}

Value FluentPipeline::apply(const Value& input, Context& ctx) const {
    return runSteps(steps_, input, ctx);
}

std::vector<std::string> FluentPipeline::stepNames() const {
    std::vector<std::string> names;
    names.reserve(steps_.size());
    for (const auto& step : steps_) {
        names.push_back(step->name());
    }
    return names;
}

std::string FluentPipeline::describe() const {
    std::ostringstream oss;
    oss << "Pipeline: " << name_ << "\n";
    for (size_t i = 0; i < steps_.size(); i++) {
        const auto& step = steps_[i];
        oss << "  " << i << ". " << step->name()
            << " [" << kindName(step->kind()) << "] ("
            << describeMetadata(step->metadata()) << ")\n";
    }
    oss << "Total cost: " << metadata().cost << "\n";
    return oss.str();
}

FluentPipeline FluentPipeline::fromName(const std::string& pipeline_name,
                                        const std::string& morph_name,
                                        std::shared_ptr<MorphRegistry> registry) {
    FluentPipeline pipeline(pipeline_name, std::move(registry));
    pipeline.pipeByName(morph_name);
    return pipeline;
}

FluentPipeline createPipeline(const std::string& name) {
    return FluentPipeline(name);
}

FluentPipeline createPipeline(const std::string& name, std::shared_ptr<MorphRegistry> registry) {
    return FluentPipeline(name, std::move(registry));
}

} // namespace morpheus
