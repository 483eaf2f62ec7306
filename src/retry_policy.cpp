// src/retry_policy.cpp
#include "retry_policy.hpp"

#include <thread>

namespace ChannelStore
{
    namespace Transfer
    {

        std::chrono::milliseconds RetryPolicy::backoffFor(int failures) const
        {
            if (failures < 1)
            {
                return std::chrono::milliseconds(0);
            }
            auto delay = base_delay;
            for (int i = 1; i < failures; ++i)
            {
                if (delay >= max_delay / 2)
                {
                    return max_delay;
                }
                delay *= 2;
            }
            return delay < max_delay ? delay : max_delay;
        }

        void RetryPolicy::pause(std::chrono::milliseconds delay) const
        {
            if (delay.count() <= 0)
            {
                return;
            }
            if (sleep)
            {
                sleep(delay);
                return;
            }
            std::this_thread::sleep_for(delay);
        }

    } // namespace Transfer
} // namespace ChannelStore
