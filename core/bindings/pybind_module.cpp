// PyBind11 bindings for the Morpheus core.
// Exposes morphs, pipelines, the optimizer, the registry and the fluent
// builder to Python. Payloads and contexts are arbitrary Python objects.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DMORPHEUS_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "morph/morph.hpp"
#include "pipeline/pipeline.hpp"
#include "pipeline/optimizer.hpp"
#include "registry/morph_registry.hpp"
#include "builder/fluent_pipeline.hpp"
#include "config/engine_config.hpp"

namespace py = pybind11;

namespace {

using morpheus::Context;
using morpheus::MorphPtr;
using morpheus::Value;

// Python holds morphs through a non-const holder; nothing exposed mutates them.
using PyMorph = std::shared_ptr<morpheus::Morph>;

PyMorph toPy(const MorphPtr& morph) {
    return std::const_pointer_cast<morpheus::Morph>(morph);
}

std::vector<PyMorph> toPy(const std::vector<MorphPtr>& morphs) {
    std::vector<PyMorph> result;
    result.reserve(morphs.size());
    for (const auto& m : morphs) result.push_back(toPy(m));
    return result;
}

std::vector<MorphPtr> fromPy(const std::vector<PyMorph>& morphs) {
    return std::vector<MorphPtr>(morphs.begin(), morphs.end());
}

Value wrapObject(const py::object& obj) {
    return Value(obj);
}

py::object unwrapObject(const Value& value) {
    if (!value.has_value()) return py::none();
    return morpheus::valueAs<py::object>(value, "python payload");
}

py::object callPython(const py::function& fn, const Value& input, Context& ctx) {
    py::gil_scoped_acquire gil;
    return fn(unwrapObject(input), unwrapObject(ctx));
}

morpheus::MorphFn wrapFunction(py::function fn) {
    return [fn = std::move(fn)](const Value& input, Context& ctx) -> Value {
        return wrapObject(callPython(fn, input, ctx));
    };
}

morpheus::FluentPipeline::Predicate wrapPredicate(py::function fn) {
    return [fn = std::move(fn)](const Value& input, Context& ctx) -> bool {
        return callPython(fn, input, ctx).cast<bool>();
    };
}

py::object applyMorph(const morpheus::Morph& self, const py::object& input, const py::object& ctx) {
    Context context = wrapObject(ctx);
    return unwrapObject(self.apply(wrapObject(input), context));
}

} // namespace

PYBIND11_MODULE(morpheus_bindings, m) {
    m.doc() = "Morpheus transform composition engine";

    // ── Errors ──
    auto morph_error = py::register_exception<morpheus::MorphError>(m, "MorphError");
    py::register_exception<morpheus::InvalidMetadataError>(m, "InvalidMetadataError", morph_error);
    py::register_exception<morpheus::NotFoundError>(m, "NotFoundError", morph_error);
    py::register_exception<morpheus::DuplicateNameError>(m, "DuplicateNameError", morph_error);
    py::register_exception<morpheus::TypeMismatchError>(m, "TypeMismatchError", morph_error);
    py::register_exception<morpheus::FilterRejectedError>(m, "FilterRejectedError", morph_error);
    py::register_exception<morpheus::OptimizationError>(m, "OptimizationError", morph_error);
    py::register_exception<morpheus::ConfigError>(m, "ConfigError", morph_error);

    // ── OptimizationMetadata ──
    py::class_<morpheus::OptimizationMetadata>(m, "OptimizationMetadata")
        .def(py::init<>())
        .def(py::init([](bool pure, bool fusible, double cost, std::optional<bool> memoizable) {
                 return morpheus::OptimizationMetadata{pure, fusible, cost, memoizable};
             }),
             py::arg("pure") = true, py::arg("fusible") = true,
             py::arg("cost") = 1.0, py::arg("memoizable") = py::none())
        .def_readwrite("pure",       &morpheus::OptimizationMetadata::pure)
        .def_readwrite("fusible",    &morpheus::OptimizationMetadata::fusible)
        .def_readwrite("cost",       &morpheus::OptimizationMetadata::cost)
        .def_readwrite("memoizable", &morpheus::OptimizationMetadata::memoizable)
        .def("is_memoizable", &morpheus::OptimizationMetadata::isMemoizable)
        .def("__repr__", &morpheus::describeMetadata);

    py::enum_<morpheus::MorphKind>(m, "MorphKind")
        .value("LEAF", morpheus::MorphKind::Leaf)
        .value("IDENTITY", morpheus::MorphKind::Identity)
        .value("COMPOSITE", morpheus::MorphKind::Composite)
        .value("COMPOSED", morpheus::MorphKind::Composed)
        .value("LAZY", morpheus::MorphKind::Lazy);

    // ── Morph ──
    py::class_<morpheus::Morph, PyMorph>(m, "Morph")
        .def_property_readonly("name", &morpheus::Morph::name)
        .def_property_readonly("metadata", &morpheus::Morph::metadata)
        .def_property_readonly("kind", &morpheus::Morph::kind)
        .def("apply", &applyMorph, py::arg("input"), py::arg("context") = py::none())
        .def("then", [](const morpheus::Morph& self, const PyMorph& next) {
            return toPy(self.then(next));
        })
        .def("components", [](const morpheus::Morph& self) {
            return toPy(self.components());
        });

    m.def("create_morph", [](std::string name, py::function fn,
                             const morpheus::OptimizationMetadata& metadata) {
        return toPy(morpheus::createMorph(std::move(name), wrapFunction(std::move(fn)), metadata));
    }, py::arg("name"), py::arg("fn"),
       py::arg("metadata") = morpheus::OptimizationMetadata{});

    m.def("identity_morph", []() { return toPy(morpheus::identityMorph()); });

    m.def("compose", [](const PyMorph& first, const PyMorph& second, std::string name) {
        return toPy(morpheus::compose(first, second, std::move(name)));
    }, py::arg("first"), py::arg("second"), py::arg("name") = "");

    m.def("composed_morph", [](std::string name, const std::vector<PyMorph>& steps,
                               std::optional<py::function> post_process,
                               std::optional<bool> pure, std::optional<bool> fusible) {
        morpheus::MorphOptions options;
        options.pure = pure;
        options.fusible = fusible;
        morpheus::MorphFn post = post_process ? wrapFunction(*post_process) : nullptr;
        return toPy(std::make_shared<morpheus::ComposedMorph>(
            std::move(name), fromPy(steps), std::move(post), options));
    }, py::arg("name"), py::arg("steps"), py::arg("post_process") = py::none(),
       py::arg("pure") = py::none(), py::arg("fusible") = py::none());

    m.def("lazy_pipeline", [](const std::vector<PyMorph>& steps, std::string name) {
        return toPy(std::make_shared<morpheus::LazyMorphPipeline>(fromPy(steps), std::move(name)));
    }, py::arg("steps"), py::arg("name") = "Pipeline");

    // ── MorphPipeline ──
    py::class_<morpheus::MorphPipeline>(m, "MorphPipeline")
        .def(py::init([](const PyMorph& root, std::string name) {
                 return morpheus::MorphPipeline(root, std::move(name));
             }), py::arg("root"), py::arg("name") = "Pipeline")
        .def_static("identity", &morpheus::MorphPipeline::identity)
        .def_static("from_steps", [](const std::vector<PyMorph>& steps, std::string name) {
            return morpheus::MorphPipeline::fromSteps(fromPy(steps), std::move(name));
        }, py::arg("steps"), py::arg("name") = "Pipeline")
        .def("apply", [](const morpheus::MorphPipeline& self, const py::object& input,
                         const py::object& ctx) {
            return applyMorph(*self.root(), input, ctx);
        }, py::arg("input"), py::arg("context") = py::none())
        .def("then", [](const morpheus::MorphPipeline& self, const PyMorph& next) {
            return self.then(next);
        })
        .def_property_readonly("name", &morpheus::MorphPipeline::name)
        .def_property_readonly("metadata", &morpheus::MorphPipeline::metadata)
        .def_property_readonly("root", [](const morpheus::MorphPipeline& self) {
            return toPy(self.root());
        })
        .def("get_morphs", [](const morpheus::MorphPipeline& self) {
            return toPy(self.getMorphs());
        })
        .def("step_names", &morpheus::MorphPipeline::stepNames);

    // ── Optimizer ──
    py::class_<morpheus::OptimizerOptions>(m, "OptimizerOptions")
        .def(py::init<>())
        .def_readwrite("strip_identity", &morpheus::OptimizerOptions::strip_identity)
        .def_readwrite("fuse",           &morpheus::OptimizerOptions::fuse);

    py::class_<morpheus::OptimizationReport>(m, "OptimizationReport")
        .def(py::init<>())
        .def_readonly("steps_before",       &morpheus::OptimizationReport::steps_before)
        .def_readonly("steps_after",        &morpheus::OptimizationReport::steps_after)
        .def_readonly("identities_removed", &morpheus::OptimizationReport::identities_removed)
        .def_readonly("fusions",            &morpheus::OptimizationReport::fusions)
        .def_readonly("cost_before",        &morpheus::OptimizationReport::cost_before)
        .def_readonly("cost_after",         &morpheus::OptimizationReport::cost_after);

    py::class_<morpheus::PipelineOptimizer>(m, "PipelineOptimizer")
        .def(py::init<morpheus::OptimizerOptions>(),
             py::arg("options") = morpheus::OptimizerOptions{})
        .def("optimize", [](const morpheus::PipelineOptimizer& self,
                            const morpheus::MorphPipeline& pipeline) {
            morpheus::OptimizationReport report;
            morpheus::MorphPipeline optimized = self.optimize(pipeline, &report);
            return py::make_tuple(optimized, report);
        });

    m.def("optimize_pipeline", &morpheus::optimizePipeline);

    // ── Registry ──
    py::enum_<morpheus::DuplicatePolicy>(m, "DuplicatePolicy")
        .value("REJECT", morpheus::DuplicatePolicy::Reject)
        .value("OVERWRITE", morpheus::DuplicatePolicy::Overwrite);

    py::class_<morpheus::MorphDescriptor>(m, "MorphDescriptor")
        .def(py::init<>())
        .def_readwrite("description",      &morpheus::MorphDescriptor::description)
        .def_readwrite("category",         &morpheus::MorphDescriptor::category)
        .def_readwrite("tags",             &morpheus::MorphDescriptor::tags)
        .def_readwrite("input_type",       &morpheus::MorphDescriptor::input_type)
        .def_readwrite("output_type",      &morpheus::MorphDescriptor::output_type)
        .def_readwrite("composition_type", &morpheus::MorphDescriptor::composition_type)
        .def_readwrite("composition",      &morpheus::MorphDescriptor::composition);

    py::class_<morpheus::MorphRegistry, std::shared_ptr<morpheus::MorphRegistry>>(m, "MorphRegistry")
        .def(py::init<morpheus::DuplicatePolicy>(),
             py::arg("policy") = morpheus::DuplicatePolicy::Reject)
        .def("register_morph", [](morpheus::MorphRegistry& self, const PyMorph& morph,
                                  const morpheus::MorphDescriptor& descriptor) {
            self.registerMorph(morph, descriptor);
        }, py::arg("morph"), py::arg("descriptor") = morpheus::MorphDescriptor{})
        .def("get", [](const morpheus::MorphRegistry& self, const std::string& name) {
            return toPy(self.get(name));
        })
        .def("require", [](const morpheus::MorphRegistry& self, const std::string& name) {
            return toPy(self.require(name));
        })
        .def("descriptor", [](const morpheus::MorphRegistry& self, const std::string& name)
                -> std::optional<morpheus::MorphDescriptor> {
            auto entry = self.lookup(name);
            if (!entry) return std::nullopt;
            return entry->descriptor;
        })
        .def("contains",   &morpheus::MorphRegistry::contains)
        .def("unregister", &morpheus::MorphRegistry::unregister)
        .def("list",       &morpheus::MorphRegistry::list)
        .def("count",      &morpheus::MorphRegistry::count)
        .def("clear",      &morpheus::MorphRegistry::clear)
        .def_property("duplicate_policy",
                      &morpheus::MorphRegistry::duplicatePolicy,
                      &morpheus::MorphRegistry::setDuplicatePolicy);

    m.def("global_registry", &morpheus::globalRegistry);

    // ── FluentPipeline ──
    py::class_<morpheus::FluentPipeline>(m, "FluentPipeline")
        .def(py::init([](std::string name, std::shared_ptr<morpheus::MorphRegistry> registry) {
                 return morpheus::FluentPipeline(std::move(name), std::move(registry));
             }), py::arg("name"), py::arg("registry") = morpheus::globalRegistry())
        .def("pipe", [](morpheus::FluentPipeline& self, const PyMorph& morph)
                -> morpheus::FluentPipeline& { return self.pipe(morph); },
             py::return_value_policy::reference_internal)
        .def("pipe_by_name", &morpheus::FluentPipeline::pipeByName,
             py::return_value_policy::reference_internal)
        .def("filter", [](morpheus::FluentPipeline& self, py::function predicate)
                -> morpheus::FluentPipeline& {
            return self.filter(wrapPredicate(std::move(predicate)));
        }, py::return_value_policy::reference_internal)
        .def("conditionally", [](morpheus::FluentPipeline& self, py::function predicate,
                                 const PyMorph& morph) -> morpheus::FluentPipeline& {
            return self.conditionally(wrapPredicate(std::move(predicate)), morph);
        }, py::return_value_policy::reference_internal)
        .def("map", [](morpheus::FluentPipeline& self, py::function fn,
                       std::optional<std::string> name, std::optional<bool> pure,
                       std::optional<bool> fusible, std::optional<double> cost)
                -> morpheus::FluentPipeline& {
            morpheus::MorphOptions options;
            options.name = std::move(name);
            options.pure = pure;
            options.fusible = fusible;
            options.cost = cost;
            return self.map(wrapFunction(std::move(fn)), options);
        }, py::arg("fn"), py::arg("name") = py::none(), py::arg("pure") = py::none(),
           py::arg("fusible") = py::none(), py::arg("cost") = py::none(),
           py::return_value_policy::reference_internal)
        .def("branch", [](morpheus::FluentPipeline& self, py::function predicate,
                          const PyMorph& when_true, const PyMorph& when_false)
                -> morpheus::FluentPipeline& {
            return self.branch(wrapPredicate(std::move(predicate)), when_true, when_false);
        }, py::return_value_policy::reference_internal)
        .def("build", [](morpheus::FluentPipeline& self, const morpheus::MorphDescriptor& descriptor) {
            return toPy(self.build(descriptor));
        }, py::arg("descriptor") = morpheus::MorphDescriptor{})
        .def("apply", [](const morpheus::FluentPipeline& self, const py::object& input,
                         const py::object& ctx) {
            Context context = wrapObject(ctx);
            return unwrapObject(self.apply(wrapObject(input), context));
        }, py::arg("input"), py::arg("context") = py::none())
        .def("describe", &morpheus::FluentPipeline::describe)
        .def("step_names", &morpheus::FluentPipeline::stepNames)
        .def_static("from_name", &morpheus::FluentPipeline::fromName,
                    py::arg("pipeline_name"), py::arg("morph_name"),
                    py::arg("registry") = morpheus::globalRegistry());

    // ── Config ──
    m.def("configure_from_env", []() {
        morpheus::applyConfig(morpheus::loadConfigFromEnv());
    });

    // The global registry outlives the interpreter; drop the Python callables
    // it holds while the GIL is still available.
    py::module_::import("atexit").attr("register")(py::cpp_function([]() {
        morpheus::globalRegistry()->clear();
    }));
}
