#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace bullion::domain {

/**
 * @brief Результат операции: значение или ошибка
 *
 * Используется там, где ошибка - ожидаемый исход, а не исключительная ситуация
 * (исполнение ордера, разбор конверта задачи).
 *
 * @example
 * ```cpp
 * auto r = Result<int, std::string>::success(42);
 * if (r.isOk()) use(r.value());
 * else log(r.error());
 * ```
 */
template <typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result failure(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isOk() const { return data_.index() == 0; }

    explicit operator bool() const { return isOk(); }

    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }

    const E& error() const { return std::get<1>(data_); }

private:
    template <size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

} // namespace bullion::domain
