#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

namespace Switchboard {

/**
 * @brief Value-or-error return type used across the dispatch core.
 *
 * Usage:
 *   Result<int, std::string> parse(...)
 *   {
 *       if (bad) return Result<int, std::string>::error("bad input");
 *       return Result<int, std::string>::okay(42);
 *   }
 */
template <typename T, typename E>
class Result {
public:
    Result() : storage_(std::in_place_index<0>, T{}) {}

    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value()
    {
        if (!isValue()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(storage_);
    }

    const T& value() const
    {
        if (!isValue()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(storage_);
    }

    E& errorValue()
    {
        if (!isError()) {
            throw std::logic_error("Result::errorValue() called on value result");
        }
        return std::get<1>(storage_);
    }

    const E& errorValue() const
    {
        if (!isError()) {
            throw std::logic_error("Result::errorValue() called on value result");
        }
        return std::get<1>(storage_);
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& v) : storage_(index, std::forward<V>(v))
    {}

    std::variant<T, E> storage_;
};

} // namespace Switchboard
