#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>

#include "math_lib/Vector.h"

namespace haptic_toolbox
{
    namespace filters
    {
        /**
         * @brief Wave variable transformation for a delayed bilateral channel.
         *
         * Encodes a force/velocity pair into wave variables with impedance b:
         *
         *     u_m = (f_m + b·v_m) / sqrt(2b)      (master, sent forward)
         *     u_s = (f_s − b·v_s) / sqrt(2b)      (slave, sent backward)
         *
         * Transmitting waves instead of raw power variables keeps the channel
         * passive for any constant delay. v_m / v_s are the other site's
         * formula and are implemented as aliases of u_s / u_m.
         *
         * Velocity recovery is sign-asymmetric between master and slave; do not
         * symmetrize it.
         */
        template <typename T, std::size_t D>
        class WAVE
        {
        public:
            using VectorType = math::Vector<T, D>;

            /**
             * @throws std::invalid_argument if b <= 0.
             */
            explicit WAVE(T b)
                : b_(b)
            {
                if (!(b > T(0)))
                {
                    throw std::invalid_argument("WAVE: impedance b must be > 0");
                }
                using std::sqrt;
                sqrtTwoB_  = sqrt(b_ * T(2));
                sqrtHalfB_ = sqrt(b_ / T(2));
            }

            /// Input wave computed by the master.
            VectorType calculateUM(const VectorType &forceM, const VectorType &velM) const
            {
                return (forceM + velM * b_) / sqrtTwoB_;
            }

            /// Input wave computed by the slave.
            VectorType calculateUS(const VectorType &forceS, const VectorType &velS) const
            {
                return (forceS - velS * b_) / sqrtTwoB_;
            }

            /// Output wave at the master.
            VectorType calculateVM(const VectorType &forceM, const VectorType &velM) const
            {
                return calculateUS(forceM, velM);
            }

            /// Output wave at the slave.
            VectorType calculateVS(const VectorType &forceS, const VectorType &velS) const
            {
                return calculateUM(forceS, velS);
            }

            VectorType calculateForceM(const VectorType &uM, const VectorType &vM) const
            {
                return (uM + vM) * sqrtHalfB_;
            }

            VectorType calculateForceS(const VectorType &uS, const VectorType &vS) const
            {
                return (uS + vS) * sqrtHalfB_;
            }

            VectorType calculateVelM(const VectorType &uM, const VectorType &velM) const
            {
                return (uM - velM) / (b_ * T(2));
            }

            VectorType calculateVelS(const VectorType &uS, const VectorType &velS) const
            {
                return (uS + velS) / (b_ * T(2));
            }

            T b() const noexcept { return b_; }

        private:
            T b_;
            T sqrtTwoB_;
            T sqrtHalfB_;
        };

    } // namespace filters
} // namespace haptic_toolbox
