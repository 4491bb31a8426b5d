// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include "curl_wrap.h"
#include <hvk/extra_log.h>
#include <hvk/open_ssl.h>
#include <hvk/thread.h>

using namespace hvk;


void hvk::libcurlInit()
{
    assert(runningOnMainThread());
    openSslInit();

    //OpenSSL is set up above => CURL_GLOBAL_NOTHING
    if (const CURLcode rc = ::curl_global_init(CURL_GLOBAL_NOTHING);
        rc != CURLE_OK)
        logExtraError(_("Error during process initialization.") + L"\n\n" +
                      formatSystemError("curl_global_init", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


void hvk::libcurlTearDown()
{
    assert(runningOnMainThread());
    ::curl_global_cleanup();
}


void hvk::setCurlOption(CURL* easyHandle, const CurlOption& curlOpt) //throw SysError
{
    if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
        rc != CURLE_OK)
        throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                         formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


std::wstring hvk::formatCurlStatusCode(CURLcode sc)
{
    switch (sc) //FTP(S) related codes; curl_easy_strerror() supplies the description
    {
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            HVK_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);

        default:
            return replaceCpy(_("Curl status %x"), L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
    }
}


std::wstring hvk::getLibcurlVersion()
{
    return utfTo<std::wstring>(::curl_version());
}
