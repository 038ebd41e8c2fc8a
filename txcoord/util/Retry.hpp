/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_UTIL_RETRY_HPP
#define TXCOORD_UTIL_RETRY_HPP

#include "Status.hpp"
#include <functional>

namespace txcoord {

/**
 * A bounded number of attempts with a fixed pause between them.
 */
struct RetryPolicy
{
    unsigned attempts = 1;
    unsigned backoffMs = 0;
};

/**
 * Returns true for failures that might go away by trying again,
 * such as store conflicts and network timeouts.
 */
bool
isTransient(const Status &s);

/**
 * Runs an operation until it succeeds, fails with a permanent error,
 * or uses up the attempts the policy allows.
 * @return the status of the final attempt.
 */
Status
retry(const RetryPolicy &policy, const std::function<Status ()> &attempt);

} // namespace txcoord

#endif
