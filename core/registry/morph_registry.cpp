#include "registry/morph_registry.hpp"
#include "logging/logger.hpp"
#include <mutex>

namespace morpheus {

const char* duplicatePolicyName(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::Reject:    return "reject";
        case DuplicatePolicy::Overwrite: return "overwrite";
    }
    return "unknown";
}

void MorphRegistry::registerMorph(MorphPtr morph, MorphDescriptor descriptor) {
    if (!morph) {
        throw MorphError("Cannot register a null morph");
    }
    const std::string name = morph->name();
    if (name.empty()) {
        throw MorphError("Cannot register a morph without a name");
    }

    RegistryEntry entry;
    entry.name = name;
    entry.optimization = morph->metadata();
    entry.morph = std::move(morph);
    entry.descriptor = std::move(descriptor);

    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            if (policy_ == DuplicatePolicy::Reject) {
                throw DuplicateNameError(name);
            }
            unindex(it->second);
            entries_.erase(it);
            replaced = true;
        }

        if (!entry.descriptor.category.empty()) {
            categories_[entry.descriptor.category].insert(name);
        }
        for (const auto& tag : entry.descriptor.tags) {
            tags_[tag].insert(name);
        }
        entries_.emplace(name, std::move(entry));
    }

    if (replaced) {
        MORPHEUS_LOG_WARNING("Registry: overwrote morph '" + name + "'");
    } else {
        MORPHEUS_LOG_DEBUG("Registry: registered morph '" + name + "'");
    }
}

MorphPtr MorphRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    return (it != entries_.end()) ? it->second.morph : nullptr;
}

MorphPtr MorphRegistry::require(const std::string& name) const {
    MorphPtr morph = get(name);
    if (!morph) {
        throw NotFoundError(name);
    }
    return morph;
}

std::optional<RegistryEntry> MorphRegistry::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool MorphRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(name) > 0;
}

bool MorphRegistry::unregister(const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return false;
        unindex(it->second);
        entries_.erase(it);
    }
    MORPHEUS_LOG_DEBUG("Registry: removed morph '" + name + "'");
    return true;
}

std::vector<std::string> MorphRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    return names;
}

std::vector<MorphPtr> MorphRegistry::getByCategory(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = categories_.find(category);
    if (it == categories_.end()) return {};
    return collect(it->second);
}

std::vector<MorphPtr> MorphRegistry::getByTag(const std::string& tag) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tags_.find(tag);
    if (it == tags_.end()) return {};
    return collect(it->second);
}

size_t MorphRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void MorphRegistry::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
        categories_.clear();
        tags_.clear();
    }
    MORPHEUS_LOG_DEBUG("Registry: cleared");
}

DuplicatePolicy MorphRegistry::duplicatePolicy() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return policy_;
}

void MorphRegistry::setDuplicatePolicy(DuplicatePolicy policy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    policy_ = policy;
}

// Caller holds the exclusive lock.
void MorphRegistry::unindex(const RegistryEntry& entry) {
    auto cat = categories_.find(entry.descriptor.category);
    if (cat != categories_.end()) {
        cat->second.erase(entry.name);
        if (cat->second.empty()) categories_.erase(cat);
    }
    for (const auto& tag : entry.descriptor.tags) {
        auto it = tags_.find(tag);
        if (it == tags_.end()) continue;
        it->second.erase(entry.name);
        if (it->second.empty()) tags_.erase(it);
    }
}

// Caller holds at least a shared lock.
std::vector<MorphPtr> MorphRegistry::collect(const std::set<std::string>& names) const {
    std::vector<MorphPtr> result;
    for (const auto& name : names) {
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            result.push_back(it->second.morph);
        }
    }
    return result;
}

std::shared_ptr<MorphRegistry> globalRegistry() {
    static std::shared_ptr<MorphRegistry> registry = std::make_shared<MorphRegistry>();
    return registry;
}

} // namespace morpheus
