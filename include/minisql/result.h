#pragma once

#include "minisql/diagnostic.h"

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace minisql {

// ==============================================================================
// Result<T> - value or Diagnostic
// ==============================================================================

/// Tag type for constructing error result
struct ErrorTag {};
inline constexpr ErrorTag error_tag{};

/// Result type for operations that can fail with a diagnostic
template<typename T>
class Result {
public:
    using value_type = T;
    using error_type = Diagnostic;

    // Success constructors
    Result(const T& value) : storage_(value) {}
    Result(T&& value) : storage_(std::move(value)) {}

    // Error constructors
    Result(ErrorTag, const Diagnostic& err) : storage_(err) {}
    Result(ErrorTag, Diagnostic&& err) : storage_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const Diagnostic& error() const& {
        if (has_value()) throw std::runtime_error("Result has value, not error");
        return std::get<1>(storage_);
    }

    [[nodiscard]] Diagnostic&& error() && {
        if (has_value()) throw std::runtime_error("Result has value, not error");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(value()); }

private:
    std::variant<T, Diagnostic> storage_;
};

// ==============================================================================
// Result<void> specialization (Status)
// ==============================================================================

template<>
class Result<void> {
public:
    using value_type = void;
    using error_type = Diagnostic;

    Result() = default;

    Result(ErrorTag, const Diagnostic& err) : error_(err) {}
    Result(ErrorTag, Diagnostic&& err) : error_(std::move(err)) {}

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) throw std::runtime_error("Result has no value");
    }

    [[nodiscard]] const Diagnostic& error() const& {
        if (has_value()) throw std::runtime_error("Result has value, not error");
        return *error_;
    }

private:
    std::optional<Diagnostic> error_;
};

/// Status is an alias for Result<void>
using Status = Result<void>;

// ==============================================================================
// Factory functions
// ==============================================================================

template<typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline Status Ok() {
    return Status();
}

template<typename T>
[[nodiscard]] Result<T> Err(const Diagnostic& error) {
    return Result<T>(error_tag, error);
}

template<typename T>
[[nodiscard]] Result<T> Err(Diagnostic&& error) {
    return Result<T>(error_tag, std::move(error));
}

[[nodiscard]] inline Status Err(const Diagnostic& error) {
    return Status(error_tag, error);
}

} // namespace minisql
