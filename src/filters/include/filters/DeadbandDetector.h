#pragma once

#include <cstddef>
#include <stdexcept>

#include "math_lib/Vector.h"

namespace haptic_toolbox
{
    namespace filters
    {
        /**
         * @brief Perceptual deadband detector for streamed samples.
         *
         * A sample is "in the deadband" of the last retained sample P when
         *
         *     ‖P − V‖ ≤ threshold · ‖P‖
         *
         * i.e. its change relative to P is below a just-noticeable fraction.
         * Samples inside the deadband are suppressed (not worth transmitting);
         * a sample outside it becomes the new reference.
         *
         * The threshold is a relative fraction, intended for [0, 1]. With a
         * zero reference the radius is zero, so every nonzero sample is
         * reported outside the deadband.
         */
        template <typename T, std::size_t D>
        class DeadbandDetector
        {
        public:
            using VectorType = math::Vector<T, D>;

            /**
             * @throws std::invalid_argument if threshold < 0 or NaN.
             */
            DeadbandDetector(T threshold, const VectorType &initialVals)
                : prevVals_(initialVals),
                  threshold_(threshold)
            {
                if (!(threshold >= T(0)))
                {
                    throw std::invalid_argument("DeadbandDetector: threshold must be >= 0");
                }
                updateDeadband();
            }

            /**
             * @brief Test a sample against the current deadband.
             *
             * @return true if the sample is suppressed. Otherwise the sample is
             *         adopted as the new reference and false is returned.
             */
            bool isInDeadband(const VectorType &vals)
            {
                if ((prevVals_ - vals).norm() <= deadband_)
                {
                    return true;
                }

                prevVals_ = vals;
                updateDeadband();
                return false;
            }

            T threshold() const noexcept { return threshold_; }

            /// @return false (and nothing changes) if t < 0 or NaN.
            bool setThreshold(T t)
            {
                if (!(t >= T(0)))
                {
                    return false;
                }
                threshold_ = t;
                updateDeadband();
                return true;
            }

            /// Absolute deadband radius around the current reference.
            T deadband() const noexcept { return deadband_; }

            const VectorType &prevVals() const noexcept { return prevVals_; }

            /// Reseed the reference sample without running the deadband test.
            void setPrevVals(const VectorType &vals)
            {
                prevVals_ = vals;
                updateDeadband();
            }

        private:
            void updateDeadband()
            {
                deadband_ = threshold_ * prevVals_.norm();
            }

            VectorType prevVals_;
            T threshold_;
            T deadband_ = T(0);
        };

    } // namespace filters
} // namespace haptic_toolbox
