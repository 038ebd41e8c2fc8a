/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TXCOORD_HTTP_HTTP_REQUEST_HPP
#define TXCOORD_HTTP_HTTP_REQUEST_HPP

#include "../util/Status.hpp"
#include <curl/curl.h>

namespace txcoord {

struct HttpReply
{
    /** The HTTP status code. */
    long code;
    /** The returned message body. */
    std::string body;

    /**
     * Verifies that the response code is in the 200 range.
     */
    Status
    codeOk() const;
};

/**
 * A class for building up and making HTTP requests.
 */
class HttpRequest
{
public:
    ~HttpRequest();
    HttpRequest();

    /**
     * Adds a header to the HTTP request.
     */
    HttpRequest &
    header(const std::string &key, const std::string &value);

    /**
     * Bounds the whole request, connection included, to this many seconds.
     */
    HttpRequest &
    timeout(long seconds);

    /**
     * Performs an HTTP GET operation.
     * A request that runs out of time fails with TXC_CC_ObserverTimeout.
     */
    Status
    get(HttpReply &result, const std::string &url);

    /**
     * Performs an HTTP POST operation.
     */
    Status
    post(HttpReply &result, const std::string &url,
         const std::string &body="");

protected:
    Status status_;
    CURL *handle_;

private:
    struct curl_slist *headers_;

    Status init();
};

} // namespace txcoord

#endif
