#pragma once
#include <cmath>
#include <string>
#include <sstream>
#include <concepts>
#include <algorithm>

#include "gaskit/utility/debug.hpp"


namespace gaskit::math {

    template <typename T>
    concept IsScalar = std::floating_point<T> || std::integral<T>;


    template <IsScalar T>
    struct Vec2 {
        using type = T;

        T x, y;

        constexpr Vec2() : x(0), y(0) {}
        constexpr Vec2(T x, T y) : x(x), y(y) {}
        constexpr explicit Vec2(T v) : x(v), y(v) {}


        // --------------
        // ARITHMETIC OPS
        // --------------
        // vector addition
        constexpr Vec2 operator+(const Vec2& other) const noexcept {
            return {x + other.x, y + other.y};
        }

        // vector subtraction
        constexpr Vec2 operator-(const Vec2& other) const noexcept {
            return {x - other.x, y - other.y};
        }

        // point-wise multiplication
        constexpr Vec2 operator*(const Vec2& other) const noexcept {
            return {x * other.x, y * other.y};
        }

        // point wise division
        constexpr Vec2 operator/(const Vec2& other) const noexcept {
            return {x / other.x, y / other.y};
        }

        // unary minus
        constexpr Vec2 operator-() const noexcept {
            return {-x, -y};
        }

        // scalar multiplication
        constexpr Vec2 operator*(const T scalar) const noexcept {
            return {x * scalar, y * scalar};
        }

        // scalar division
        constexpr Vec2 operator/(const T scalar) const noexcept {
            return {x / scalar, y / scalar};
        }

        // scalar multiplication with the scalar on the left
        friend constexpr Vec2 operator*(const T scalar, const Vec2& rhs) noexcept {
            return rhs * scalar;
        }


        // --------------------
        // COMPOUND ASSIGNMENTS
        // --------------------
        constexpr Vec2& operator+=(const Vec2& rhs) noexcept {
            x += rhs.x;
            y += rhs.y;
            return *this;
        }

        constexpr Vec2& operator-=(const Vec2& rhs) noexcept {
            x -= rhs.x;
            y -= rhs.y;
            return *this;
        }

        constexpr Vec2& operator*=(const T scalar) noexcept {
            x *= scalar;
            y *= scalar;
            return *this;
        }

        constexpr Vec2& operator/=(const T scalar) noexcept {
            x /= scalar;
            y /= scalar;
            return *this;
        }


        // -------------------
        // GEOMETRIC FUNCTIONS
        // -------------------
        [[nodiscard]] constexpr T dot(const Vec2& rhs) const noexcept {
            return x * rhs.x + y * rhs.y;
        }

        [[nodiscard]] constexpr T norm_squared() const noexcept {
            return x * x + y * y;
        }

        [[nodiscard]] T norm() const noexcept {
            return std::sqrt(norm_squared());
        }


        // -------------------
        // ORDERING & EQUALITY
        // -------------------
        // v <= u iff for all v_i: v_i <= u_i
        constexpr bool operator==(const Vec2& other) const noexcept {
            return x == other.x && y == other.y;
        }

        constexpr bool operator<=(const Vec2& other) const noexcept {
            return x <= other.x && y <= other.y;
        }

        constexpr bool operator>=(const Vec2& other) const noexcept {
            return x >= other.x && y >= other.y;
        }


        // ---------
        // ACCESSORS
        // ---------
        // Access component by index: 0 for x, 1 for y
        T& operator[](const int index) noexcept {
            GK_ASSERT(index >= 0 && index < 2, "Index out of bounds");
            return index == 0 ? x : y;
        }

        const T& operator[](const int index) const noexcept {
            GK_ASSERT(index >= 0 && index < 2, "Index out of bounds");
            return index == 0 ? x : y;
        }

        [[nodiscard]] constexpr T max() const noexcept {
            return std::max(x, y);
        }

        [[nodiscard]] constexpr T min() const noexcept {
            return std::min(x, y);
        }


        //-----------------
        // LOGIC PREDICATES
        // ----------------
        template <typename Predicate>
        bool any(Predicate predicate) const {
            return predicate(x) || predicate(y);
        }

        template <typename Predicate>
        bool all(Predicate predicate) const {
            return predicate(x) && predicate(y);
        }


        [[nodiscard]] std::string to_string() const {
            std::ostringstream oss;
            oss << "{" << x << ", " << y << "}";
            return oss.str();
        }
    };

} // namespace gaskit::math
