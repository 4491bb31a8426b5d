// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <string>
#include <string_view>
#include "utf.h"


//native file path string: UTF-8 on Linux, also used for FTP paths
using Zchar = char;
#define Zstr(x) x

using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_73425873425789
