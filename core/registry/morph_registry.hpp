#pragma once

#include "morph/morph.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace morpheus {

/// What happens when a name is registered twice.
enum class DuplicatePolicy {
    Reject,     // throw DuplicateNameError, keep the first entry
    Overwrite,  // replace the entry and log a warning
};

const char* duplicatePolicyName(DuplicatePolicy policy);

// ─── Morph Descriptor ─────────────────────────────────────────
// Free-form description of a registered morph. `composition` is the
// ordered list of constituent names for builder-produced morphs.

struct MorphDescriptor {
    std::string description;
    std::string category;
    std::vector<std::string> tags;
    std::string input_type = "unknown";
    std::string output_type = "unknown";
    std::string composition_type;
    std::vector<std::string> composition;
};

struct RegistryEntry {
    std::string name;
    MorphPtr morph;
    MorphDescriptor descriptor;
    OptimizationMetadata optimization;
};

// ─── Morph Registry ───────────────────────────────────────────
// Name → morph table shared by every call site that assembles pipelines
// by name. Reads take a shared lock, writes an exclusive one.
// No input/output type compatibility is checked between entries.

class MorphRegistry {
public:
    explicit MorphRegistry(DuplicatePolicy policy = DuplicatePolicy::Reject)
        : policy_(policy) {}

    MorphRegistry(const MorphRegistry&) = delete;
    MorphRegistry& operator=(const MorphRegistry&) = delete;

    /// Register under morph->name(). Throws MorphError on a null morph or an
    /// empty name, DuplicateNameError under the Reject policy.
    void registerMorph(MorphPtr morph, MorphDescriptor descriptor = {});

    /// The named morph, or nullptr when absent.
    MorphPtr get(const std::string& name) const;

    /// The named morph; throws NotFoundError when absent.
    MorphPtr require(const std::string& name) const;

    /// Full entry (descriptor included).
    std::optional<RegistryEntry> lookup(const std::string& name) const;

    bool contains(const std::string& name) const;

    /// Remove a morph by name. Returns true if found.
    bool unregister(const std::string& name);

    /// Registered names in lexicographic order.
    std::vector<std::string> list() const;

    std::vector<MorphPtr> getByCategory(const std::string& category) const;
    std::vector<MorphPtr> getByTag(const std::string& tag) const;

    size_t count() const;
    void clear();

    DuplicatePolicy duplicatePolicy() const;
    void setDuplicatePolicy(DuplicatePolicy policy);

private:
    void unindex(const RegistryEntry& entry);
    std::vector<MorphPtr> collect(const std::set<std::string>& names) const;

    mutable std::shared_mutex mutex_;
    DuplicatePolicy policy_;
    std::map<std::string, RegistryEntry> entries_;
    std::map<std::string, std::set<std::string>> categories_;
    std::map<std::string, std::set<std::string>> tags_;
};

/// Process-scoped registry, created on first use and destroyed at exit.
/// Code that wants isolation constructs its own MorphRegistry instead.
std::shared_ptr<MorphRegistry> globalRegistry();

} // namespace morpheus
