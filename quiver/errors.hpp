#ifndef QUIVERKIT_ERRORS_HPP
#define QUIVERKIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace quiverkit {

// Base class for precondition violations on quivers and their embeddings.
// These are input errors, never transient: callers are not expected to retry.
class QuiverError : public std::runtime_error {
public:
    explicit QuiverError(const std::string& what) : std::runtime_error(what) {}
};

class DuplicateNameError : public QuiverError {
public:
    explicit DuplicateNameError(const std::string& name)
        : QuiverError("Duplicate vertex name: " + name) {}
};

class UnknownVertexError : public QuiverError {
public:
    explicit UnknownVertexError(const std::string& name)
        : QuiverError("Unknown vertex: " + name) {}
};

class SelfLoopError : public QuiverError {
public:
    explicit SelfLoopError(const std::string& name)
        : QuiverError("Self-loop at vertex: " + name) {}
};

class FrozenMutationError : public QuiverError {
public:
    explicit FrozenMutationError(const std::string& name)
        : QuiverError("Cannot mutate at frozen vertex: " + name) {}
};

class DisconnectedLaminationError : public QuiverError {
public:
    DisconnectedLaminationError(const std::string& from, const std::string& to)
        : QuiverError("No edge path connects " + from + " and " + to) {}
};

// An arc weight left the range of int
class WeightOverflowError : public QuiverError {
public:
    explicit WeightOverflowError(const std::string& what) : QuiverError(what) {}
};

// Lamination endpoints must be frozen vertices
class InvalidLaminationError : public QuiverError {
public:
    explicit InvalidLaminationError(const std::string& what) : QuiverError(what) {}
};

// Malformed triangulation, or one that does not match the quiver
class EmbeddingError : public QuiverError {
public:
    explicit EmbeddingError(const std::string& what) : QuiverError(what) {}
};

}  // namespace quiverkit

#endif // QUIVERKIT_ERRORS_HPP
