#pragma once
#include <optional>
#include <utility>
#include <variant>

#include "presencelink/core/ipc_error.hpp"

namespace presencelink {
namespace utils {

// Generic Result<T> template
// Holds either a value of type T or a typed error (IpcError by default)

template <typename T, typename E = core::IpcError>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    // Error constructor
    Result(const E& error) : data_(std::in_place_index<1>, error) {}
    Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool has_value() const { return data_.index() == 0; }
    bool has_error() const { return data_.index() == 1; }
    explicit operator bool() const { return has_value(); }

    // Throws std::bad_variant_access when the other alternative is held
    const T& value() const& { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }
    const E& error() const { return std::get<1>(data_); }

private:
    std::variant<T, E> data_;
};

// Specialization for void

template <typename E>
class Result<void, E> {
public:
    // Success constructor
    Result() = default;
    // Error constructor
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    bool has_value() const { return !error_.has_value(); }
    bool has_error() const { return error_.has_value(); }
    explicit operator bool() const { return has_value(); }

    // Throws std::bad_optional_access on success
    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

} // namespace utils
} // namespace presencelink

// For convenience, provide a top-level alias
namespace presencelink {
using utils::Result;
using core::ErrorCode;
using core::ErrorCategory;
using core::IpcError;
}
