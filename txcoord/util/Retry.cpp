/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Retry.hpp"
#include "Debug.hpp"
#include <chrono>
#include <thread>

namespace txcoord {

bool
isTransient(const Status &s)
{
    return TXC_CC_StorageConflict == s.value() ||
           TXC_CC_ObserverTimeout == s.value();
}

Status
retry(const RetryPolicy &policy, const std::function<Status ()> &attempt)
{
    unsigned attempts = policy.attempts ? policy.attempts : 1;

    Status s;
    for (unsigned i = 0; i < attempts; ++i)
    {
        if (i && policy.backoffMs)
            std::this_thread::sleep_for(
                std::chrono::milliseconds(policy.backoffMs));

        s = attempt();
        if (s || !isTransient(s))
            return s;

        TXC_DebugLog("Attempt %u of %u failed: %s", i + 1, attempts,
                     s.message().c_str());
    }
    return s;
}

} // namespace txcoord
