#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

namespace chronicle::domain {

/**
 * @brief Значение для Result без полезной нагрузки
 */
struct Done {};

/**
 * @brief Результат операции: значение T либо ошибка E
 *
 * Ожидаемые ошибки (конфликт версий, недоступность хранилища) возвращаются
 * как значения, чтобы вызывающий код обязан был их разобрать.
 *
 * @example
 * ```cpp
 * auto result = store->append(id, events, 4);
 * if (!result) {
 *     std::visit([](const auto& e) { std::cerr << e.message() << std::endl; }, result.error());
 * }
 * ```
 */
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result fail(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isOk() const { return data_.index() == 0; }
    explicit operator bool() const { return isOk(); }

    const T& value() const {
        if (!isOk()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(data_);
    }

    T& value() {
        if (!isOk()) {
            throw std::logic_error("Result::value() called on error result");
        }
        return std::get<0>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::logic_error("Result::error() called on ok result");
        }
        return std::get<1>(data_);
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, E> data_;
};

} // namespace chronicle::domain
