#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <initializer_list>

namespace haptic_toolbox
{
    namespace math
    {
        /**
         * @brief Stack-based fixed-size vector over a real scalar field T.
         *
         * - No dynamic memory
         * - No exceptions
         * - T needs +, -, *, /, comparison, construction from 0 and a sqrt()
         *   reachable through std:: or argument-dependent lookup.
         *
         * Division by zero is NOT masked: IEEE types produce inf/nan, which
         * callers are expected to see.
         */
        template <typename T, std::size_t N>
        class Vector
        {
        public:
            using value_type = T;

            std::array<T, N> data;

            constexpr Vector() noexcept : data{}
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] = T(0);
                }
            }

            constexpr Vector(const std::array<T, N> &arr) noexcept : data(arr)
            {
            }

            // Missing trailing entries are zero-filled, extra ones are ignored.
            constexpr Vector(std::initializer_list<T> list) noexcept : data{}
            {
                auto it = list.begin();
                for (std::size_t i = 0; i < N; ++i)
                {
                    if (it != list.end())
                    {
                        data[i] = *it++;
                    }
                    else
                    {
                        data[i] = T(0);
                    }
                }
            }

            static constexpr Vector<T, N> Zero() noexcept
            {
                return Vector<T, N>();
            }

            static constexpr Vector<T, N> Constant(T val) noexcept
            {
                Vector<T, N> result;
                result.setConstant(val);
                return result;
            }

            // ------------------------------------------------------------------
            // Accessors
            // ------------------------------------------------------------------
            constexpr T &operator[](std::size_t i) noexcept { return data[i]; }
            constexpr const T &operator[](std::size_t i) const noexcept { return data[i]; }
            static constexpr std::size_t size() noexcept { return N; }
            constexpr T *dataPtr() noexcept { return data.data(); }
            constexpr const T *dataPtr() const noexcept { return data.data(); }

            // ------------------------------------------------------------------
            // Basic Arithmetic
            // ------------------------------------------------------------------
            constexpr Vector<T, N> operator+(const Vector<T, N> &other) const noexcept
            {
                Vector<T, N> result;
                for (std::size_t i = 0; i < N; ++i)
                {
                    result[i] = data[i] + other[i];
                }
                return result;
            }

            constexpr Vector<T, N> operator-(const Vector<T, N> &other) const noexcept
            {
                Vector<T, N> result;
                for (std::size_t i = 0; i < N; ++i)
                {
                    result[i] = data[i] - other[i];
                }
                return result;
            }

            constexpr Vector<T, N> operator-() const noexcept
            {
                Vector<T, N> result;
                for (std::size_t i = 0; i < N; ++i)
                {
                    result[i] = -data[i];
                }
                return result;
            }

            constexpr Vector<T, N> operator*(T scalar) const noexcept
            {
                Vector<T, N> result;
                for (std::size_t i = 0; i < N; ++i)
                {
                    result[i] = data[i] * scalar;
                }
                return result;
            }

            constexpr Vector<T, N> operator/(T scalar) const noexcept
            {
                Vector<T, N> result;
                for (std::size_t i = 0; i < N; ++i)
                {
                    result[i] = data[i] / scalar;
                }
                return result;
            }

            constexpr bool operator==(const Vector<T, N> &other) const noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    if (!(data[i] == other.data[i]))
                    {
                        return false;
                    }
                }
                return true;
            }

            constexpr bool operator!=(const Vector<T, N> &other) const noexcept
            {
                return !(*this == other);
            }

            // ------------------------------------------------------------------
            // In-place arithmetic
            // ------------------------------------------------------------------
            constexpr Vector<T, N> &operator+=(const Vector<T, N> &other) noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] += other.data[i];
                }
                return *this;
            }

            constexpr Vector<T, N> &operator-=(const Vector<T, N> &other) noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] -= other.data[i];
                }
                return *this;
            }

            constexpr Vector<T, N> &operator*=(T scalar) noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] *= scalar;
                }
                return *this;
            }

            constexpr Vector<T, N> &operator/=(T scalar) noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] /= scalar;
                }
                return *this;
            }

            // ------------------------------------------------------------------
            // Vector-Specific Utilities
            // ------------------------------------------------------------------
            constexpr T dot(const Vector<T, N> &other) const noexcept
            {
                T sum = T(0);
                for (std::size_t i = 0; i < N; ++i)
                {
                    sum += data[i] * other.data[i];
                }
                return sum;
            }

            constexpr T sum() const noexcept
            {
                T s = T(0);
                for (std::size_t i = 0; i < N; ++i)
                {
                    s += data[i];
                }
                return s;
            }

            constexpr T squaredNorm() const noexcept
            {
                return dot(*this);
            }

            T norm() const noexcept
            {
                using std::sqrt;
                return sqrt(dot(*this));
            }

            // Near-zero vectors are returned unchanged.
            Vector<T, N> normalized() const noexcept
            {
                const T n = norm();
                if (n < T(1e-12))
                {
                    return *this;
                }
                return *this / n;
            }

            // cross() only valid if N==3
            constexpr Vector<T, 3> cross(const Vector<T, 3> &other) const noexcept
            {
                static_assert(N == 3, "cross() only valid for 3D vectors");
                return Vector<T, 3>{
                    data[1] * other.data[2] - data[2] * other.data[1], // x
                    data[2] * other.data[0] - data[0] * other.data[2], // y
                    data[0] * other.data[1] - data[1] * other.data[0]  // z
                };
            }

            constexpr Vector<T, N> cwiseMultiply(const Vector<T, N> &other) const noexcept
            {
                Vector<T, N> result;
                for (std::size_t i = 0; i < N; ++i)
                {
                    result[i] = data[i] * other.data[i];
                }
                return result;
            }

            constexpr void setZero() noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] = T(0);
                }
            }

            constexpr void setConstant(T val) noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    data[i] = val;
                }
            }

            bool allFinite() const noexcept
            {
                for (std::size_t i = 0; i < N; ++i)
                {
                    if (!std::isfinite(data[i]))
                    {
                        return false;
                    }
                }
                return true;
            }

            friend constexpr Vector<T, N> operator*(T scalar, const Vector<T, N> &v) noexcept
            {
                return v * scalar; // Reuse the member operator
            }
        };

        template <std::size_t N>
        using Vectord = Vector<double, N>;

        template <std::size_t N>
        using Vectorf = Vector<float, N>;

        using Vector3d = Vector<double, 3>;

    } // namespace math
} // namespace haptic_toolbox
