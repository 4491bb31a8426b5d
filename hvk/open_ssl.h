// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace hvk
{
//main thread, before libcurl starts any TLS session: libcurl's FTPS backend shares the OpenSSL state
void openSslInit();

//"c2VjcmV0" => "secret"; characters outside the Base64 alphabet are skipped
std::string stringDecodeBase64(std::string_view str);
}

#endif //OPEN_SSL_H_801974580936508934568792347506
