#pragma once

#include <utility>
#include <variant>

namespace sbr {

// Either a value or an error; errors are data, never thrown.
template <typename T, typename E>
class Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return storage_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<0>(storage_); }
    T& value() & { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    const E& error() const { return std::get<1>(storage_); }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    std::variant<T, E> storage_;
};

} // namespace sbr
