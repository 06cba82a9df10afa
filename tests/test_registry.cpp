#include <gtest/gtest.h>
#include "registry/morph_registry.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace morpheus;

MorphPtr constantMorph(const std::string& name, int value) {
    return makeMorph<int, int>(name, [value](int) { return value; });
}

int applyInt(const MorphPtr& morph, int input) {
    Context ctx;
    return std::any_cast<int>(morph->apply(input, ctx));
}

// ─── Round trip ───────────────────────────────────────────────

TEST(RegistryTest, RegisterAndGet) {
    MorphRegistry registry;
    EXPECT_EQ(registry.count(), 0u);

    auto morph = constantMorph("seven", 7);
    registry.registerMorph(morph);
    EXPECT_EQ(registry.count(), 1u);
    EXPECT_TRUE(registry.contains("seven"));
    EXPECT_EQ(registry.get("seven"), morph);
    EXPECT_EQ(registry.require("seven"), morph);
}

TEST(RegistryTest, UnknownNameSignalsNotFound) {
    MorphRegistry registry;
    EXPECT_EQ(registry.get("unknown-name"), nullptr);
    EXPECT_FALSE(registry.lookup("unknown-name").has_value());
    EXPECT_FALSE(registry.contains("unknown-name"));

    try {
        registry.require("unknown-name");
        FAIL() << "require() should throw";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.name(), "unknown-name");
    }
}

TEST(RegistryTest, LookupReturnsDescriptorAndMetadata) {
    MorphRegistry registry;
    OptimizationMetadata md;
    md.cost = 3.0;
    md.pure = false;
    auto morph = makeMorph<int, int>("scale", [](int x) { return x * 3; }, md);

    MorphDescriptor descriptor;
    descriptor.description = "Scales by three";
    descriptor.category = "math";
    descriptor.tags = {"numeric", "linear"};
    descriptor.input_type = "int";
    descriptor.output_type = "int";
    registry.registerMorph(morph, descriptor);

    auto entry = registry.lookup("scale");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "scale");
    EXPECT_EQ(entry->morph, morph);
    EXPECT_EQ(entry->descriptor.description, "Scales by three");
    EXPECT_EQ(entry->descriptor.input_type, "int");
    EXPECT_EQ(entry->descriptor.tags.size(), 2u);
    EXPECT_DOUBLE_EQ(entry->optimization.cost, 3.0);
    EXPECT_FALSE(entry->optimization.pure);
}

TEST(RegistryTest, RejectsNullAndUnnamedMorphs) {
    MorphRegistry registry;
    EXPECT_THROW(registry.registerMorph(nullptr), MorphError);
    EXPECT_THROW(registry.registerMorph(constantMorph("", 1)), MorphError);
    EXPECT_EQ(registry.count(), 0u);
}

// ─── Duplicate policy ─────────────────────────────────────────

TEST(RegistryTest, RejectPolicyKeepsFirstRegistration) {
    MorphRegistry registry(DuplicatePolicy::Reject);
    auto first = constantMorph("answer", 1);
    registry.registerMorph(first);

    EXPECT_THROW(registry.registerMorph(constantMorph("answer", 2)), DuplicateNameError);
    EXPECT_EQ(registry.get("answer"), first);
    EXPECT_EQ(applyInt(registry.require("answer"), 0), 1);
    EXPECT_EQ(registry.count(), 1u);
}

TEST(RegistryTest, OverwritePolicyReplacesDeterministically) {
    MorphRegistry registry(DuplicatePolicy::Overwrite);
    registry.registerMorph(constantMorph("answer", 1));
    auto second = constantMorph("answer", 2);
    EXPECT_NO_THROW(registry.registerMorph(second));

    EXPECT_EQ(registry.get("answer"), second);
    EXPECT_EQ(applyInt(registry.require("answer"), 0), 2);
    EXPECT_EQ(registry.count(), 1u);
}

TEST(RegistryTest, OverwriteReindexesCategoriesAndTags) {
    MorphRegistry registry(DuplicatePolicy::Overwrite);
    MorphDescriptor old_desc;
    old_desc.category = "old";
    old_desc.tags = {"stale"};
    registry.registerMorph(constantMorph("m", 1), old_desc);

    MorphDescriptor new_desc;
    new_desc.category = "new";
    new_desc.tags = {"fresh"};
    registry.registerMorph(constantMorph("m", 2), new_desc);

    EXPECT_TRUE(registry.getByCategory("old").empty());
    EXPECT_TRUE(registry.getByTag("stale").empty());
    EXPECT_EQ(registry.getByCategory("new").size(), 1u);
    EXPECT_EQ(registry.getByTag("fresh").size(), 1u);
}

TEST(RegistryTest, PolicyCanChangeAtRuntime) {
    MorphRegistry registry;
    EXPECT_EQ(registry.duplicatePolicy(), DuplicatePolicy::Reject);
    registry.registerMorph(constantMorph("m", 1));
    registry.setDuplicatePolicy(DuplicatePolicy::Overwrite);
    EXPECT_NO_THROW(registry.registerMorph(constantMorph("m", 2)));
    EXPECT_EQ(applyInt(registry.require("m"), 0), 2);
}

// ─── Catalog ──────────────────────────────────────────────────

TEST(RegistryTest, CategoriesAndTags) {
    MorphRegistry registry;
    MorphDescriptor view;
    view.category = "view";
    view.tags = {"format"};
    MorphDescriptor graph;
    graph.category = "graph";
    graph.tags = {"format", "cypher"};

    registry.registerMorph(constantMorph("toView", 1), view);
    registry.registerMorph(constantMorph("toCypher", 2), graph);

    EXPECT_EQ(registry.getByCategory("view").size(), 1u);
    EXPECT_EQ(registry.getByCategory("graph").size(), 1u);
    EXPECT_EQ(registry.getByTag("format").size(), 2u);
    EXPECT_EQ(registry.getByTag("cypher").size(), 1u);
    EXPECT_TRUE(registry.getByTag("missing").empty());
}

TEST(RegistryTest, ListIsSorted) {
    MorphRegistry registry;
    registry.registerMorph(constantMorph("gamma", 3));
    registry.registerMorph(constantMorph("alpha", 1));
    registry.registerMorph(constantMorph("beta", 2));
    EXPECT_EQ(registry.list(), (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST(RegistryTest, UnregisterAndClear) {
    MorphRegistry registry;
    MorphDescriptor desc;
    desc.category = "c";
    desc.tags = {"t"};
    registry.registerMorph(constantMorph("a", 1), desc);
    registry.registerMorph(constantMorph("b", 2));

    EXPECT_TRUE(registry.unregister("a"));
    EXPECT_FALSE(registry.unregister("a"));
    EXPECT_EQ(registry.get("a"), nullptr);
    EXPECT_TRUE(registry.getByCategory("c").empty());
    EXPECT_TRUE(registry.getByTag("t").empty());

    registry.clear();
    EXPECT_EQ(registry.count(), 0u);
}

TEST(RegistryTest, IsolatedRegistriesDoNotShareEntries) {
    MorphRegistry left;
    MorphRegistry right;
    left.registerMorph(constantMorph("only-left", 1));
    EXPECT_TRUE(left.contains("only-left"));
    EXPECT_FALSE(right.contains("only-left"));
}

TEST(RegistryTest, GlobalRegistryIsShared) {
    EXPECT_EQ(globalRegistry(), globalRegistry());
}

// ─── Concurrency ──────────────────────────────────────────────

TEST(RegistryTest, ConcurrentRegistrationAndLookup) {
    MorphRegistry registry;
    constexpr int kWriters = 4;
    constexpr int kPerWriter = 200;
    std::atomic<int> lookups_seen{0};

    std::vector<std::thread> threads;
    for (int w = 0; w < kWriters; w++) {
        threads.emplace_back([&registry, w]() {
            for (int i = 0; i < kPerWriter; i++) {
                registry.registerMorph(
                    constantMorph("w" + std::to_string(w) + "_" + std::to_string(i), i));
            }
        });
    }
    threads.emplace_back([&registry, &lookups_seen]() {
        for (int i = 0; i < kPerWriter; i++) {
            if (registry.get("w0_" + std::to_string(i))) lookups_seen++;
            registry.list();
        }
    });
    for (auto& t : threads) t.join();

    EXPECT_EQ(registry.count(), static_cast<size_t>(kWriters * kPerWriter));
    EXPECT_LE(lookups_seen.load(), kPerWriter);
}
