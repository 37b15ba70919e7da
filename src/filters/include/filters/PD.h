#pragma once

#include <cstddef>

#include "math_lib/Vector.h"

namespace haptic_toolbox
{
    namespace filters
    {
        /**
         * @brief Proportional-derivative tracker for a reference position/velocity.
         */
        template <typename T, std::size_t D>
        class PD
        {
        public:
            using VectorType = math::Vector<T, D>;

            PD(T kP, T kD)
                : kP_(kP),
                  kD_(kD)
            {
            }

            VectorType calculateForce(const VectorType &posRef,
                                      const VectorType &pos,
                                      const VectorType &velRef,
                                      const VectorType &vel) const
            {
                return (posRef - pos) * kP_ + (velRef - vel) * kD_;
            }

            T kP() const noexcept { return kP_; }
            T kD() const noexcept { return kD_; }

            void setKP(T kP) noexcept { kP_ = kP; }
            void setKD(T kD) noexcept { kD_ = kD; }

        private:
            T kP_;
            T kD_;
        };

    } // namespace filters
} // namespace haptic_toolbox
