#pragma once

#include <stdexcept>
#include <string>

namespace morpheus {

// ─── Error Taxonomy ───────────────────────────────────────────
// Every engine error derives from MorphError so callers can catch the
// whole family. Errors raised by collaborator functions inside apply()
// are never wrapped and do not derive from it.

class MorphError : public std::runtime_error {
public:
    explicit MorphError(const std::string& what) : std::runtime_error(what) {}
};

/// Malformed metadata (negative or non-finite cost) at construction time.
class InvalidMetadataError : public MorphError {
public:
    explicit InvalidMetadataError(const std::string& what) : MorphError(what) {}
};

/// A name was looked up in a registry that does not hold it.
class NotFoundError : public MorphError {
public:
    explicit NotFoundError(const std::string& name)
        : MorphError("Morph not found in registry: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// A registry configured to reject duplicates saw a second registration.
class DuplicateNameError : public MorphError {
public:
    explicit DuplicateNameError(const std::string& name)
        : MorphError("Morph already registered: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// A payload did not hold the type a typed morph expected.
class TypeMismatchError : public MorphError {
public:
    explicit TypeMismatchError(const std::string& what) : MorphError(what) {}
};

/// A filter step's predicate did not hold; the pipeline stops there.
class FilterRejectedError : public MorphError {
public:
    explicit FilterRejectedError(const std::string& filter_name)
        : MorphError("Input rejected by filter: " + filter_name),
          filter_name_(filter_name) {}

    const std::string& filterName() const { return filter_name_; }

private:
    std::string filter_name_;
};

/// The optimizer could not flatten or rebuild a pipeline safely.
class OptimizationError : public MorphError {
public:
    explicit OptimizationError(const std::string& what) : MorphError(what) {}
};

class ConfigError : public MorphError {
public:
    explicit ConfigError(const std::string& what) : MorphError(what) {}
};

} // namespace morpheus
