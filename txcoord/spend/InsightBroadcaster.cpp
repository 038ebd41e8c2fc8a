/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "InsightBroadcaster.hpp"
#include "../CoordinatorSettings.hpp"
#include "Inputs.hpp"
#include "../crypto/Encoding.hpp"
#include "../http/HttpRequest.hpp"

namespace txcoord {

InsightBroadcaster::InsightBroadcaster(const std::string &server,
                                       long timeout):
    server_(server),
    timeout_(timeout)
{
}

InsightBroadcaster::InsightBroadcaster(const CoordinatorSettings &settings):
    InsightBroadcaster(settings.insightServer(), settings.httpTimeout())
{
}

Status
InsightBroadcaster::broadcast(DataSlice rawTx)
{
    std::string body = "rawtx=" + base16Encode(rawTx);

    HttpReply reply;
    Status s = HttpRequest().
               header("Content-Type", "application/x-www-form-urlencoded").
               timeout(timeout_).
               post(reply, server_ + "/api/tx/send", body);
    if (!s)
        return TXC_ERROR(TXC_CC_DispatchFailed, s.message());
    if (!reply.codeOk())
        return TXC_ERROR(TXC_CC_DispatchFailed, "Broadcast rejected: " +
                         reply.body);

    return Status();
}

Status
InsightBroadcaster::signSpeedup(bc::transaction_type &tx,
                                const SpeedupInputList &inputs,
                                const bc::transaction_output_list &outputs,
                                IKeyManager &keys)
{
    inputsFill(tx, inputs);
    tx.outputs = outputs;
    TXC_CHECK(signTx(tx, inputs, keys));
    return Status();
}

} // namespace txcoord
