#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace larder {

/**
 * Base exception for all Larder errors.
 */
class LarderError : public std::runtime_error {
public:
    explicit LarderError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the referenced id has no live record.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if a payload or invariant check rejected the call.
     */
    virtual bool is_invalid_operation() const { return false; }

    /**
     * Returns true if the store can no longer be trusted to continue.
     */
    virtual bool is_fatal() const { return false; }

    /**
     * Maps the error onto the status returned to RPC callers.
     */
    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::UNKNOWN, what());
    }
};

/**
 * Thrown when an operation references an id with no live record.
 * Maps to gRPC NOT_FOUND.
 */
class NotFoundError : public LarderError {
public:
    explicit NotFoundError(const std::string& message)
        : LarderError(message) {}

    bool is_not_found() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
    }
};

/**
 * Thrown when a payload is invalid or a stock change would break an invariant.
 * Maps to gRPC INVALID_ARGUMENT.
 */
class InvalidOperationError : public LarderError {
public:
    explicit InvalidOperationError(const std::string& message)
        : LarderError(message) {}

    bool is_invalid_operation() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * Base for unrecoverable failures. Maps to gRPC INTERNAL.
 */
class FatalError : public LarderError {
public:
    explicit FatalError(const std::string& message)
        : LarderError(message) {}

    bool is_fatal() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INTERNAL, what());
    }
};

/**
 * Thrown when the durable backend fails to read or persist state.
 */
class StorageError : public FatalError {
public:
    explicit StorageError(const std::string& message)
        : FatalError(message) {}
};

/**
 * Thrown when a record cannot be encoded within the size bound.
 */
class EncodeError : public FatalError {
public:
    explicit EncodeError(const std::string& message)
        : FatalError(message) {}
};

/**
 * Thrown when stored bytes do not decode to a record.
 */
class DecodeError : public FatalError {
public:
    explicit DecodeError(const std::string& message)
        : FatalError(message) {}
};

/**
 * Thrown on arithmetic overflow and other broken internal assumptions.
 */
class InternalError : public FatalError {
public:
    explicit InternalError(const std::string& message)
        : FatalError(message) {}
};

/**
 * Thrown when the server configuration cannot be loaded.
 */
class ConfigError : public LarderError {
public:
    explicit ConfigError(const std::string& message)
        : LarderError(message) {}
};

} // namespace larder
