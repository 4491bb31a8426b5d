// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include "extra_log.h"
#include "thread.h"

using namespace hvk;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL 3 required");


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const unsigned long ec = ::ERR_get_error(); //pops the oldest entry
    ::ERR_clear_error();

    char errorBuf[256] = {};
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf));

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


//per-thread error queues are not released automatically: worker threads exit before the process does
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp() { ::OPENSSL_thread_stop(); }
};
thread_local OpenSslThreadCleanUp openSslThreadCleanUp;
}


void hvk::openSslInit()
{
    assert(runningOnMainThread());
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


std::string hvk::stringDecodeBase64(std::string_view str)
{
    std::string base64;
    for (const char c : str)
        if (isDigit(c) || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '+' || c == '/')
            base64 += c;

    const size_t paddingLen = (4 - base64.size() % 4) % 4;
    if (paddingLen == 3) //a single trailing character carries no full byte
        base64.pop_back();
    else
        base64.append(paddingLen, '=');

    if (base64.empty())
        return std::string();

    std::string output(base64.size() / 4 * 3, '\0');
    const int bytesDecoded = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                               reinterpret_cast<const unsigned char*>(base64.data()), static_cast<int>(base64.size()));
    if (bytesDecoded < 0) //not reachable after filtering above
        return std::string();

    output.resize(bytesDecoded - (paddingLen == 3 ? 0 : paddingLen)); //EVP_DecodeBlock() counts padding as zero bytes
    return output;
}
