#pragma once

#include <cstddef>
#include <vector>

namespace haptic_toolbox
{
    namespace teleop
    {
        /**
         * @brief Fixed sample delay, standing in for a constant-latency channel.
         *
         * push() returns the sample pushed `delay` calls earlier (the initial
         * value until the line has filled). A delay of 0 passes samples through.
         */
        template <typename Sample>
        class DelayLine
        {
        public:
            DelayLine(std::size_t delay, const Sample &initial)
                : buffer_(delay, initial)
            {
            }

            Sample push(const Sample &in)
            {
                if (buffer_.empty())
                {
                    return in;
                }
                Sample out = buffer_[head_];
                buffer_[head_] = in;
                head_ = (head_ + 1) % buffer_.size();
                return out;
            }

            std::size_t delay() const noexcept { return buffer_.size(); }

        private:
            std::vector<Sample> buffer_;
            std::size_t head_ = 0;
        };

    } // namespace teleop
} // namespace haptic_toolbox
