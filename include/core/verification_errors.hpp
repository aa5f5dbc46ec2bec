#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Root of the verification error taxonomy.
 *
 * Fatal errors (DecodeError, AssetNotFoundError, StorageReadError, OperationCancelledError) abort a run and
 * reach the caller. The remaining types are absorbed by the pipeline into signal-availability metadata.
 */
class VerificationError : public std::runtime_error
{
public:
    explicit VerificationError(const std::string &message) : std::runtime_error(message) {}
};

/// Corrupt, unsupported, empty or out-of-bounds image input.
class DecodeError : public VerificationError
{
public:
    explicit DecodeError(const std::string &message) : VerificationError(message) {}
};

/// Two embeddings of different dimensionality or model version were compared.
class DimensionMismatchError : public VerificationError
{
public:
    explicit DimensionMismatchError(const std::string &message) : VerificationError(message) {}
};

class EmbeddingUnavailableError : public VerificationError
{
public:
    explicit EmbeddingUnavailableError(const std::string &message) : VerificationError(message) {}
};

class EmbeddingTimeoutError : public VerificationError
{
public:
    explicit EmbeddingTimeoutError(const std::string &message) : VerificationError(message) {}
};

class ManipulationDetectorUnavailable : public VerificationError
{
public:
    explicit ManipulationDetectorUnavailable(const std::string &message) : VerificationError(message) {}
};

class SemanticVerifierFailure : public VerificationError
{
public:
    explicit SemanticVerifierFailure(const std::string &message) : VerificationError(message) {}
};

class SemanticVerifierTimeout : public SemanticVerifierFailure
{
public:
    explicit SemanticVerifierTimeout(const std::string &message) : SemanticVerifierFailure(message) {}
};

class StorageWriteError : public VerificationError
{
public:
    explicit StorageWriteError(const std::string &message) : VerificationError(message) {}
};

class StorageReadError : public VerificationError
{
public:
    explicit StorageReadError(const std::string &message) : VerificationError(message) {}
};

class AssetNotFoundError : public VerificationError
{
public:
    explicit AssetNotFoundError(const std::string &message) : VerificationError(message) {}
};

class OperationCancelledError : public VerificationError
{
public:
    explicit OperationCancelledError(const std::string &message) : VerificationError(message) {}
};
