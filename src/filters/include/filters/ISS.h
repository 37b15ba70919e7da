#pragma once

#include <cstddef>
#include <stdexcept>

#include "math_lib/Vector.h"

namespace haptic_toolbox
{
    namespace filters
    {
        /**
         * @brief Input-to-State Stable (ISS) force/velocity compensator.
         *
         * Less conservative than strict passivity: the coupled system may
         * generate energy, but only an amount bounded by a constant.
         *
         * - calculateForce() low-pass-inverts the force with time constant tau.
         * - calculateVel() shapes the velocity command so that the force-velocity
         *   gradient stays within [0, muMax].
         *
         * dt is never checked: dt == 0 yields non-finite output.
         */
        template <typename T, std::size_t D>
        class ISS
        {
        public:
            using VectorType = math::Vector<T, D>;

            /**
             * @throws std::invalid_argument if tau < 0 or muMax <= 0.
             */
            ISS(T tau, T muMax)
                : tau_(tau),
                  muMax_(muMax)
            {
                if (!(muMax > T(0)))
                {
                    throw std::invalid_argument("ISS: mu_max must be > 0");
                }
                if (!(tau >= T(0)))
                {
                    throw std::invalid_argument("ISS: tau must be >= 0");
                }
            }

            /// force + (force − prevForce) · tau / dt, then remembers force.
            VectorType calculateForce(const VectorType &force, T dt)
            {
                VectorType issForce = force + (force - prevForce_) * tau_ / dt;
                prevForce_ = force;
                return issForce;
            }

            /**
             * @brief vel − (force − prevForce) / dt / muMax.
             *
             * Pure read. Pass the same force sample as the latest
             * calculateForce() call, and call it before that update if the
             * derivative term should be non-zero.
             */
            VectorType calculateVel(const VectorType &vel, const VectorType &force, T dt) const
            {
                return vel - (force - prevForce_) / dt / muMax_;
            }

            T tau() const noexcept { return tau_; }
            T muMax() const noexcept { return muMax_; }
            const VectorType &prevForce() const noexcept { return prevForce_; }

            /// @return false (and nothing changes) if tau < 0.
            bool setTau(T tau)
            {
                if (!(tau >= T(0)))
                {
                    return false;
                }
                tau_ = tau;
                return true;
            }

            /// @return false (and nothing changes) if muMax <= 0.
            bool setMuMax(T muMax)
            {
                if (!(muMax > T(0)))
                {
                    return false;
                }
                muMax_ = muMax;
                return true;
            }

        private:
            T tau_;
            T muMax_;
            VectorType prevForce_;
        };

    } // namespace filters
} // namespace haptic_toolbox
