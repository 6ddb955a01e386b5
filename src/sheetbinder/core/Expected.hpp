#pragma once

#include "sheetbinder/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace sheetbinder {
namespace core {

/**
 * @brief Expected<T, E> - 值或错误
 *
 * 类似于 std::expected (C++23)。汇总流程中每个工作单元（批次、客户、文件）
 * 都以结果值返回，而不是抛出异常。
 */
template<typename T, typename E = Error>
class Expected {
    static_assert(!std::is_same_v<T, E>, "Expected<T, E> requires distinct value and error types");

private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

public:
    using value_type = T;
    using error_type = E;

    // ========== 构造函数 ==========

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    // ========== 赋值操作符 ==========

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected tmp(other);
            destroy();
            has_value_ = tmp.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(tmp.value_));
            } else {
                new(&error_) E(std::move(tmp.error_));
            }
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(other.value_));
            } else {
                new(&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问 ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    const T& valueOr(const T& default_value) const & noexcept {
        return has_value_ ? value_ : default_value;
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    // ========== 函数式操作 ==========

    /**
     * @brief 映射操作（成功时）
     */
    template<typename F>
    auto map(F&& func) const -> Expected<decltype(func(std::declval<const T&>())), E> {
        using U = decltype(func(std::declval<const T&>()));
        if (has_value_) {
            return Expected<U, E>(func(value_));
        }
        return Expected<U, E>(error_);
    }
};

/**
 * @brief 便利函数：创建错误结果
 */
template<typename T>
Expected<T, Error> makeUnexpected(ErrorCode code, const std::string& message,
                                  const std::string& context = "") {
    return Expected<T, Error>(Error(code, message, context));
}

}} // namespace sheetbinder::core
