#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

#include "math_lib/Vector.h"

namespace haptic_toolbox
{
    namespace filters
    {
        /**
         * @brief Time Domain Passivity Approach (TDPA) controller.
         *
         * Keeps a running energy ledger of the port
         *
         *     E_k = E_{k-1} + f_k · v_k + alpha_{k-1} · ‖v_{k-1}‖²
         *
         * where the last term books the energy dissipated by the previous
         * correction. Whenever E_k < 0 the port has produced energy and a
         * damping coefficient alpha_k = −E_k / ‖v_k‖² is injected into the
         * output force (f + alpha · v), which cancels the deficit on the next
         * tick.
         *
         * If ‖v_k‖² is not above minVelocitySquared, or −E_k / ‖v_k‖² overflows,
         * no damping can be applied: alpha is left at zero and the deficit
         * stays in the ledger.
         */
        template <typename T, std::size_t D>
        class TDPA
        {
        public:
            using VectorType = math::Vector<T, D>;

            TDPA() = default;

            /**
             * @throws std::invalid_argument if minVelocitySquared < 0.
             */
            explicit TDPA(T minVelocitySquared)
                : minVelocitySquared_(minVelocitySquared)
            {
                if (!(minVelocitySquared >= T(0)))
                {
                    throw std::invalid_argument("TDPA: min velocity squared must be >= 0");
                }
            }

            VectorType calculateForce(const VectorType &vel, const VectorType &force)
            {
                energy_ += force.dot(vel) + alpha_ * prevVel_.dot(prevVel_);
                prevVel_ = vel;

                alpha_ = T(0);
                const T velSq = vel.dot(vel);
                if (energy_ < T(0) && velSq > minVelocitySquared_)
                {
                    using std::isfinite;
                    const T alpha = -energy_ / velSq;
                    if (isfinite(alpha))
                    {
                        alpha_ = alpha;
                    }
                }

                if (alpha_ == T(0))
                {
                    return force;
                }
                return force + vel * alpha_;
            }

            /// Damping injected on the latest tick (>= 0).
            T alpha() const noexcept { return alpha_; }

            /// Energy ledger before the latest correction is booked.
            T energy() const noexcept { return energy_; }

            const VectorType &prevVel() const noexcept { return prevVel_; }

            T minVelocitySquared() const noexcept { return minVelocitySquared_; }

        private:
            T alpha_  = T(0);
            T energy_ = T(0);
            VectorType prevVel_;
            T minVelocitySquared_ = std::numeric_limits<T>::min();
        };

    } // namespace filters
} // namespace haptic_toolbox
