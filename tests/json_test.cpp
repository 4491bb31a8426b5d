// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#include <gtest/gtest.h>
#include <hvk/json.h>

using namespace hvk;


TEST(Json, ParseValues)
{
    const JsonValue root = parseJson("\xEF\xBB\xBF" R"( {"list": [1, -2.5e3, true, null], "name": "x", "name": "ignored", "empty": {}} )");
    ASSERT_EQ(root.type, JsonValue::Type::object);

    const JsonValue* list = getChildFromJsonObject(root, "list");
    ASSERT_TRUE(list);
    ASSERT_EQ(list->type, JsonValue::Type::array);
    ASSERT_EQ(list->arrayVal.size(), 4U);
    EXPECT_EQ(list->arrayVal[0].primVal, "1");
    EXPECT_EQ(list->arrayVal[1].type, JsonValue::Type::number);
    EXPECT_EQ(list->arrayVal[1].primVal, "-2.5e3");
    EXPECT_EQ(list->arrayVal[2].type, JsonValue::Type::boolean);
    EXPECT_EQ(list->arrayVal[2].primVal, "true");
    EXPECT_EQ(list->arrayVal[3].type, JsonValue::Type::null);

    EXPECT_EQ(getChildFromJsonObject(root, "name")->primVal, "x");
    EXPECT_EQ(getChildFromJsonObject(root, "empty")->type, JsonValue::Type::object);
    EXPECT_FALSE(getChildFromJsonObject(root, "missing"));
    EXPECT_FALSE(getChildFromJsonObject(*list, "list"));
}


TEST(Json, StringEscapes)
{
    EXPECT_EQ(parseJson(R"("tab\t\"q\"\/\\")").primVal, "tab\t\"q\"/\\");
    EXPECT_EQ(parseJson(R"("a\u00e9\ud83d\ude00b")").primVal, "a\xC3\xA9\xF0\x9F\x98\x80" "b");
    EXPECT_EQ(parseJson(R"("\ud800x")").primVal, "\xEF\xBF\xBD" "x"); //unpaired surrogate
    EXPECT_THROW(parseJson(R"("\u12")"), JsonParsingError);
}


TEST(Json, SyntaxErrorPosition)
{
    try
    {
        parseJson("[1,\n  ]");
        FAIL();
    }
    catch (const JsonParsingError& e)
    {
        EXPECT_EQ(e.row, 1U);
        EXPECT_EQ(e.col, 2U);
    }

    EXPECT_THROW(parseJson("{} x"), JsonParsingError);
    EXPECT_THROW(parseJson(R"({"a" 1})"), JsonParsingError);
    EXPECT_THROW(parseJson(R"(["open)"), JsonParsingError);
    EXPECT_THROW(parseJson(""), JsonParsingError);
}
