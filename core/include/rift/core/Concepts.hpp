/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces across the core.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CORE_CONCEPTS_HPP
    #define RIFT_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace rift::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to snapshot by value and to compare for replication.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

} // namespace rift::core

#endif // RIFT_CORE_CONCEPTS_HPP
