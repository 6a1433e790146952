/*
 * mdguard C++17 - Error types
 *
 * Core algorithms throw these; orchestration code converts them into
 * result structs (see transform_pipeline.hpp).
 */
#ifndef mdguard_CORE_ERRORS_HPP
#define mdguard_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mdguard {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Invalid limits or settings; raised before any work starts
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

// protect() refused its input
class DetectionError : public Error {
public:
    DetectionError(const std::string& message, const std::string& token)
        : Error(message), token_(token) {}

    const std::string& token() const { return token_; }

private:
    std::string token_;
};

class RestorationError : public Error {
public:
    enum Reason {
        MISSING,
        DUPLICATED,
        UNKNOWN,
        INVALID_FORMAT,
        LEFTOVER,
        MALFORMED_RECORD
    };

    RestorationError(Reason reason, const std::string& message, const std::string& token = "")
        : Error(message), reason_(reason), token_(token) {}

    // Schema helpers construct errors from a message alone
    explicit RestorationError(const std::string& message)
        : Error(message), reason_(MALFORMED_RECORD) {}

    Reason reason() const { return reason_; }
    const std::string& token() const { return token_; }

private:
    Reason reason_;
    std::string token_;
};

// The chunk planner produced something it should never produce
class PlanInvariantError : public Error {
public:
    explicit PlanInvariantError(const std::string& message) : Error(message) {}
};

// A serialized record (chunk plan, restoration map) is malformed
class RecordError : public Error {
public:
    explicit RecordError(const std::string& message) : Error(message) {}
};

// One chunk of a pipeline run could not be transformed or restored
class TransformError : public Error {
public:
    TransformError(const std::string& chunk_id, const std::string& message)
        : Error(chunk_id + ": " + message), chunk_id_(chunk_id) {}

    const std::string& chunk_id() const { return chunk_id_; }

private:
    std::string chunk_id_;
};

// ============================================================================
// QA validator errors: original vs restored text disagree
// ============================================================================

class QaError : public Error {
public:
    explicit QaError(const std::string& message) : Error(message) {}
};

class FenceCountMismatch : public QaError {
public:
    explicit FenceCountMismatch(const std::string& message) : QaError(message) {}
};

class MathDelimiterMismatch : public QaError {
public:
    explicit MathDelimiterMismatch(const std::string& message) : QaError(message) {}
};

class UrlTargetMismatch : public QaError {
public:
    explicit UrlTargetMismatch(const std::string& message) : QaError(message) {}
};

} // namespace mdguard

#endif // mdguard_CORE_ERRORS_HPP
