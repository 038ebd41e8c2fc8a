/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "HttpRequest.hpp"
#include "../util/Debug.hpp"

namespace txcoord {

#define TIMEOUT 10

static Status curlOk(CURLcode code)
{
    if (code)
    {
        std::string message("cURL error: ");
        if (curl_easy_strerror(code))
            message += curl_easy_strerror(code);
        else
            message += std::to_string(code);
        if (CURLE_OPERATION_TIMEDOUT == code)
            return TXC_ERROR(TXC_CC_ObserverTimeout, message);
        return TXC_ERROR(TXC_CC_Error, message);
    }
    return Status();
}

#define TXC_CHECK_CURL(code) TXC_CHECK(curlOk(code))

static size_t
curlDataCallback(void *data, size_t memberSize, size_t numMembers,
                 void *userData)
{
    auto size = numMembers * memberSize;

    auto string = static_cast<std::string *>(userData);
    string->append(static_cast<char *>(data), size);

    return size;
}

Status
HttpReply::codeOk() const
{
    if (code < 200 || 300 <= code)
        return TXC_ERROR(TXC_CC_Error, "Bad HTTP status code " +
                         std::to_string(code));
    return Status();
}

HttpRequest::~HttpRequest()
{
    if (handle_) curl_easy_cleanup(handle_);
    if (headers_) curl_slist_free_all(headers_);
}

HttpRequest::HttpRequest():
    handle_(nullptr),
    headers_(nullptr)
{
    status_ = init();
}

HttpRequest &
HttpRequest::header(const std::string &key, const std::string &value)
{
    if (!status_)
        return *this;

    std::string header = key + ": " + value;
    auto slist = curl_slist_append(headers_, header.c_str());
    if (!slist)
        status_ = TXC_ERROR(TXC_CC_Error, "cURL slist error");
    else
        headers_ = slist;

    return *this;
}

HttpRequest &
HttpRequest::timeout(long seconds)
{
    if (status_)
        status_ = curlOk(curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT,
                                          seconds));
    if (status_)
        status_ = curlOk(curl_easy_setopt(handle_, CURLOPT_TIMEOUT, seconds));
    return *this;
}

Status
HttpRequest::get(HttpReply &result, const std::string &url)
{
    if (!status_)
        return status_;

    // Final options:
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &result.body));
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION,
                                    curlDataCallback));
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_URL, url.c_str()));
    if (headers_)
        TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers_));

    // Make the request:
    TXC_CHECK_CURL(curl_easy_perform(handle_));
    TXC_CHECK_CURL(curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE,
                                     &result.code));
    if (result.codeOk())
        TXC_DebugLog("%s (%ld)", url.c_str(), result.code);
    else
        TXC_DebugLog("%s (%ld)\n%s", url.c_str(), result.code,
                     result.body.c_str());

    return Status();
}

Status
HttpRequest::post(HttpReply &result, const std::string &url,
                  const std::string &body)
{
    if (!status_)
        return status_;

    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE,
                                    static_cast<long>(body.size())));
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_COPYPOSTFIELDS,
                                    body.c_str()));
    return get(result, url);
}

Status
HttpRequest::init()
{
    handle_ = curl_easy_init();
    if (!handle_)
        return TXC_ERROR(TXC_CC_Error, "cURL failed create handle");

    // Basic options:
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L));
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT,
                                    static_cast<long>(TIMEOUT)));
    TXC_CHECK_CURL(curl_easy_setopt(handle_, CURLOPT_TIMEOUT,
                                    static_cast<long>(TIMEOUT)));

    return Status();
}

} // namespace txcoord
