#include "morph/metadata.hpp"
#include "morph/errors.hpp"
#include <cmath>
#include <sstream>

namespace morpheus {

void validateMetadata(const OptimizationMetadata& metadata, const std::string& owner) {
    if (!std::isfinite(metadata.cost)) {
        throw InvalidMetadataError("Cost of '" + owner + "' is not finite");
    }
    if (metadata.cost < 0.0) {
        std::ostringstream oss;
        oss << "Cost of '" << owner << "' is negative: " << metadata.cost;
        throw InvalidMetadataError(oss.str());
    }
}

OptimizationMetadata sequenceMetadata(const OptimizationMetadata& first,
                                      const OptimizationMetadata& second) {
    OptimizationMetadata combined;
    combined.pure = first.pure && second.pure;
    combined.fusible = first.fusible && second.fusible;
    combined.cost = first.cost + second.cost;
    combined.memoizable = first.isMemoizable() && second.isMemoizable();
    return combined;
}

OptimizationMetadata sequenceMetadata(const std::vector<OptimizationMetadata>& parts) {
    OptimizationMetadata combined;
    combined.cost = 0.0;
    combined.memoizable = true;
    for (const auto& part : parts) {
        combined = sequenceMetadata(combined, part);
    }
    return combined;
}

OptimizationMetadata MorphOptions::resolve(const OptimizationMetadata& defaults) const {
    OptimizationMetadata resolved = defaults;
    if (pure) resolved.pure = *pure;
    if (fusible) resolved.fusible = *fusible;
    if (cost) resolved.cost = *cost;
    if (memoizable) resolved.memoizable = *memoizable;
    return resolved;
}

std::string describeMetadata(const OptimizationMetadata& metadata) {
    std::ostringstream oss;
    oss << "pure=" << (metadata.pure ? "true" : "false")
        << " fusible=" << (metadata.fusible ? "true" : "false")
        << " cost=" << metadata.cost
        << " memoizable=" << (metadata.isMemoizable() ? "true" : "false");
    return oss.str();
}

} // namespace morpheus
