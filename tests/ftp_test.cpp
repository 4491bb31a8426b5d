// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../FtpHarvest/Source/afs/ftp.h"

using namespace hvk;
using namespace fhv;


TEST(Ftp, LoginPhraseDefaultServer)
{
    const FtpLoginPhrase lp = parseFtpLoginPhrase(Zstr("ftp://science-pds.cryosat.esa.int/SIR_SAR_L2"));
    EXPECT_EQ(lp.login.server, Zstr("science-pds.cryosat.esa.int"));
    EXPECT_EQ(lp.login.portCfg, 0);
    EXPECT_TRUE(lp.login.username.empty());
    EXPECT_EQ(lp.basePath, Zstr("/SIR_SAR_L2"));
    EXPECT_FALSE(lp.login.useTls);
    EXPECT_EQ(lp.login.timeoutSec, 180);
}


TEST(Ftp, LoginPhraseWithCredentialsAndOptions)
{
    const FtpLoginPhrase lp = parseFtpLoginPhrase(Zstr("ftp://user%40example.com:p@ss@private.example.com:222/data//sub/|ssl|timeout=60"));
    EXPECT_EQ(lp.login.server, Zstr("private.example.com"));
    EXPECT_EQ(lp.login.portCfg, 222);
    EXPECT_EQ(lp.login.username, Zstr("user@example.com"));
    ASSERT_TRUE(lp.login.password);
    EXPECT_EQ(*lp.login.password, Zstr("p@ss"));
    EXPECT_EQ(lp.basePath, Zstr("/data/sub"));
    EXPECT_TRUE(lp.login.useTls);
    EXPECT_EQ(lp.login.timeoutSec, 60);
}


TEST(Ftp, LoginPhrasePasswordOptions)
{
    const FtpLoginPhrase lp64 = parseFtpLoginPhrase(Zstr("ftp://me@host|pass64=c2VjcmV0"));
    ASSERT_TRUE(lp64.login.password);
    EXPECT_EQ(*lp64.login.password, Zstr("secret"));
    EXPECT_EQ(lp64.basePath, Zstr("/"));

    const FtpLoginPhrase lpPrompt = parseFtpLoginPhrase(Zstr("ftp://me@host/x|pwprompt"));
    EXPECT_FALSE(lpPrompt.login.password);
}


TEST(Ftp, DisplayPath)
{
    FtpLogin login;
    login.server = Zstr("host");
    login.username = Zstr("me");
    EXPECT_EQ(getFtpDisplayPath(login, Zstr("/a/b")), L"ftp://me@host/a/b");

    login.portCfg = 2121;
    login.username.clear();
    EXPECT_EQ(getFtpDisplayPath(login, Zstr("/")), L"ftp://host:2121");
}


TEST(Ftp, SplitResponse)
{
    const std::string buf = "220 Welcome\r\n\r\n230 Logged in\n";
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "220 Welcome");
    EXPECT_EQ(lines[1], "230 Logged in");
}


TEST(Ftp, SizeResponse)
{
    EXPECT_EQ(parseFtpSizeResponse("213 123456789\r\n"), 123456789u);
    EXPECT_EQ(parseFtpSizeResponse("150 Opening\r\n213 0\r\n"), 0u);
    EXPECT_FALSE(parseFtpSizeResponse("550 Could not get file size.\r\n"));
    EXPECT_FALSE(parseFtpSizeResponse("502 Command not implemented.\r\n"));

    EXPECT_THROW(parseFtpSizeResponse("213 unknown\r\n"), SysError);
    EXPECT_THROW(parseFtpSizeResponse("421 Service not available\r\n"), SysError);
}


TEST(Ftp, StatusText)
{
    EXPECT_EQ(formatFtpStatus(530), L"FTP status 530: User not logged in.");
    EXPECT_EQ(formatFtpStatus(299), L"FTP status 299.");
}
