#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    // -- ValueOr ------------------------------------------------------------

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(storage_));
        }
        return default_value;
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies session subsystem failures.
//
// Absence of a stored session is a value, not SessionNotFound. The category
// is reserved for requests that carry no usable session id at all.
// MalformedIdentityInput is never returned; it names degraded resolutions
// in logs.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    BackendUnavailable,
    SessionNotFound,
    RecoveryExhausted,
    MalformedIdentityInput,
    TransportConstructionFailed,
    Config,
    Tool,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error type for store, registry and recovery operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string key;          // backend key or session id, may be empty
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    static Error BackendUnavailable(const std::string& operation,
                                    const std::string& key,
                                    const std::string& message);

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:                      return 2;
            case ErrorCategory::BackendUnavailable:          return 3;
            case ErrorCategory::RecoveryExhausted:           return 4;
            case ErrorCategory::TransportConstructionFailed: return 5;
            case ErrorCategory::Tool:                        return 6;
            case ErrorCategory::SessionNotFound:             return 7;
            case ErrorCategory::MalformedIdentityInput:      return 8;
            case ErrorCategory::Internal:                    return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::BackendUnavailable:          return "backend_unavailable";
            case ErrorCategory::SessionNotFound:             return "session_not_found";
            case ErrorCategory::RecoveryExhausted:           return "recovery_exhausted";
            case ErrorCategory::MalformedIdentityInput:      return "malformed_identity_input";
            case ErrorCategory::TransportConstructionFailed: return "transport_construction_failed";
            case ErrorCategory::Config:                      return "config";
            case ErrorCategory::Tool:                        return "tool";
            case ErrorCategory::Internal:                    return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               key == other.key &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcp_gateway
