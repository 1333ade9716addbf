#pragma once

#include <optional>
#include <utility>
#include <variant>

#include "chunkfs/core/error.h"

namespace chunkfs::core {

namespace detail {
inline const Error& NoError() {
    static const Error kNone{};
    return kNone;
}
}  // namespace detail

/// @brief Value-or-Error return type; module boundaries report failures through it instead
/// of throwing.
///
/// error() on a successful result yields a kOk error, so it is always safe to log.
template <typename T>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const Error& error) : state_(std::in_place_index<1>, error) {}
    Result(Error&& error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return state_.index() == 0; }
    const T& value() const { return std::get<0>(state_); }
    T& value() { return std::get<0>(state_); }
    const Error& error() const { return ok() ? detail::NoError() : std::get<1>(state_); }

private:
    std::variant<T, Error> state_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    void value() const {}
    const Error& error() const { return error_ ? *error_ : detail::NoError(); }

private:
    std::optional<Error> error_;
};

inline Result<void> Ok() { return Result<void>(); }

}  // namespace chunkfs::core
