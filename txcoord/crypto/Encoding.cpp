/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <new>

namespace txcoord {

typedef std::unique_ptr<BIO, decltype(&BIO_free_all)> BioPtr;

static int
hexValue(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + c - 'a';
    if ('A' <= c && c <= 'F')
        return 10 + c - 'A';
    return -1;
}

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size());
    for (auto byte: data)
    {
        out += base16Sym[byte >> 4];
        out += base16Sym[byte & 0xf];
    }
    return out;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 2 characters long:
    if (in.size() % 2)
        return TXC_ERROR(TXC_CC_ParseError, "Bad hex string length");

    DataChunk out;
    out.reserve(in.size() / 2);
    for (size_t i = 0; i < in.size(); i += 2)
    {
        int high = hexValue(in[i]);
        int low = hexValue(in[i + 1]);
        if (high < 0 || low < 0)
            return TXC_ERROR(TXC_CC_ParseError, "Bad hex character");
        out.push_back(high << 4 | low);
    }

    result = std::move(out);
    return Status();
}

std::string
base64Encode(DataSlice data)
{
    if (!data.size())
        return std::string();

    BioPtr bio(BIO_push(BIO_new(BIO_f_base64()), BIO_new(BIO_s_mem())),
               BIO_free_all);
    if (!bio)
        throw std::bad_alloc();

    // Do not use newlines to flush buffer:
    BIO_set_flags(bio.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio.get(), data.data(), data.size());
    (void)BIO_flush(bio.get());

    BUF_MEM *buffer = nullptr;
    BIO_get_mem_ptr(bio.get(), &buffer);
    return std::string(buffer->data, buffer->length);
}

Status
base64Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 4 characters long:
    if (in.size() % 4)
        return TXC_ERROR(TXC_CC_ParseError, "Bad base64 string length");
    if (in.empty())
    {
        result.clear();
        return Status();
    }

    // Padding may only appear at the end, and at most twice:
    auto padding = in.find('=');
    if (std::string::npos != padding &&
            (in.size() - padding > 2 ||
             !std::all_of(in.begin() + padding, in.end(),
                          [](char c){ return '=' == c; })))
        return TXC_ERROR(TXC_CC_ParseError, "Bad base64 padding");

    BioPtr bio(BIO_push(BIO_new(BIO_f_base64()),
                        BIO_new_mem_buf(in.data(), in.size())),
               BIO_free_all);
    if (!bio)
        throw std::bad_alloc();
    BIO_set_flags(bio.get(), BIO_FLAGS_BASE64_NO_NL);

    DataChunk out(in.size());
    int size = BIO_read(bio.get(), out.data(), out.size());
    if (size < 0)
        return TXC_ERROR(TXC_CC_ParseError, "Bad base64 string");

    size_t expected = 3 * in.size() / 4 -
                      (std::string::npos == padding ? 0 : in.size() - padding);
    if (static_cast<size_t>(size) != expected)
        return TXC_ERROR(TXC_CC_ParseError, "Bad base64 string");

    out.resize(size);
    result = std::move(out);
    return Status();
}

} // namespace txcoord
