#pragma once

#include <cstddef>

#include "math_lib/Vector.h"

namespace haptic_toolbox
{
    namespace filters
    {
        /**
         * @brief Proportional-integral-derivative tracker.
         *
         * The integral term accumulates the position error times dt on every
         * calculateForce() call. There is no anti-windup; call reset() on mode
         * changes.
         */
        template <typename T, std::size_t D>
        class PID
        {
        public:
            using VectorType = math::Vector<T, D>;

            PID(T kP, T kI, T kD)
                : kP_(kP),
                  kI_(kI),
                  kD_(kD)
            {
            }

            VectorType calculateForce(const VectorType &posRef,
                                      const VectorType &pos,
                                      const VectorType &velRef,
                                      const VectorType &vel,
                                      T dt)
            {
                const VectorType error = posRef - pos;
                integralError_ += error * dt;

                const VectorType compP = error * kP_;
                const VectorType compI = integralError_ * kI_;
                const VectorType compD = (velRef - vel) * kD_;

                return compP + compI + compD;
            }

            void reset() noexcept { integralError_.setZero(); }

            const VectorType &integralError() const noexcept { return integralError_; }

            T kP() const noexcept { return kP_; }
            T kI() const noexcept { return kI_; }
            T kD() const noexcept { return kD_; }

            void setKP(T kP) noexcept { kP_ = kP; }
            void setKI(T kI) noexcept { kI_ = kI; }
            void setKD(T kD) noexcept { kD_ = kD; }

        private:
            T kP_;
            T kI_;
            T kD_;

            VectorType integralError_;
        };

    } // namespace filters
} // namespace haptic_toolbox
