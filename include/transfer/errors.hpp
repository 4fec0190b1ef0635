#pragma once

#include "transfer/model/ErrorInfo.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace sf::transfer {

// No backend or destination matches; surfaced at submission, no task created
struct ResolutionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Submission refused by the per-owner rate limiter
struct SubmissionRejected : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Base for errors a backend classifies once at the point of occurrence
class TransferError : public std::runtime_error {
public:
    TransferError(const model::ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] model::ErrorKind kind() const { return kind_; }

    [[nodiscard]] virtual model::ErrorInfo info() const { return {kind_, what(), {}}; }

private:
    model::ErrorKind kind_;
};

class TransientTransferError : public TransferError {
public:
    explicit TransientTransferError(const std::string& what, const std::chrono::seconds retryAfter = std::chrono::seconds(0))
        : TransferError(model::ErrorKind::Transient, what), retryAfter_(retryAfter) {}

    [[nodiscard]] std::chrono::seconds retryAfter() const { return retryAfter_; }

    [[nodiscard]] model::ErrorInfo info() const override { return {kind(), what(), {}, retryAfter_}; }

private:
    std::chrono::seconds retryAfter_;
};

struct AuthError : TransferError {
    explicit AuthError(const std::string& what)
        : TransferError(model::ErrorKind::Auth, what) {}
};

class QuotaExceededError : public TransferError {
public:
    QuotaExceededError(const std::string& what, std::string account)
        : TransferError(model::ErrorKind::QuotaExceeded, what), account_(std::move(account)) {}

    [[nodiscard]] const std::string& account() const { return account_; }

    [[nodiscard]] model::ErrorInfo info() const override { return {kind(), what(), account_}; }

private:
    std::string account_;
};

struct UnsupportedOperation : TransferError {
    explicit UnsupportedOperation(const std::string& what)
        : TransferError(model::ErrorKind::Unsupported, what) {}
};

struct FatalTransferError : TransferError {
    explicit FatalTransferError(const std::string& what)
        : TransferError(model::ErrorKind::Fatal, what) {}
};

}
