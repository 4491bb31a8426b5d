// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef CURL_WRAP_H_2879058325032785032789645
#define CURL_WRAP_H_2879058325032785032789645

#include <hvk/sys_error.h>
#include <curl/curl.h>


namespace hvk
{
//main thread only: once before the first session is created, once after the last one is gone
void libcurlInit();
void libcurlTearDown();


//type-erased curl_easy_setopt() argument: long, curl_off_t or pointer
struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};

void setCurlOption(CURL* easyHandle, const CurlOption& curlOpt); //throw SysError

std::wstring formatCurlStatusCode(CURLcode sc); //"CURLE_LOGIN_DENIED"

std::wstring getLibcurlVersion(); //"libcurl/7.88.1 OpenSSL/3.0.11 ..."
}

#endif //CURL_WRAP_H_2879058325032785032789645
