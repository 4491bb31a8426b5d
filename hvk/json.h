// *****************************************************************************
// * This file is part of the FtpHarvest project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// * Modifications: Copyright (C) The FtpHarvest authors                       *
// *****************************************************************************

#ifndef JSON_H_0187348321748321758934215734
#define JSON_H_0187348321748321758934215734

#include <map>
#include <optional>
#include <vector>
#include "string_tools.h"
#include "utf.h"


namespace hvk
{
//RFC 8259, read-only: configuration files are written by the user
struct JsonValue
{
    enum class Type
    {
        null,
        boolean,
        number,
        string,
        array,
        object,
    };

    JsonValue() {}
    explicit JsonValue(Type t) : type(t) {}

    Type type = Type::null;
    std::string                      primVal; //boolean, number, string: "true", "-1.5e3", unescaped UTF-8
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //duplicate keys: first one wins
};


struct JsonParsingError
{
    JsonParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //0-based
    const size_t col; //
};
JsonValue parseJson(const std::string& stream); //throw JsonParsingError


inline
const JsonValue* getChildFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (jvalue.type == JsonValue::Type::object)
        if (auto it = jvalue.objectVal.find(name);
            it != jvalue.objectVal.end())
            return &it->second;
    return nullptr;
}








//---------------------- implementation ----------------------
namespace json_impl
{
//recursive descent directly on the character stream
class JsonReader
{
public:
    explicit JsonReader(std::string_view stream) : stream_(stream)
    {
        if (hvk::startsWith(stream_, "\xEF\xBB\xBF")) //UTF-8 BOM
            pos_ = 3;
    }

    JsonValue readDocument() //throw JsonParsingError
    {
        JsonValue jval = readValue(); //throw JsonParsingError
        if (skipWhiteSpace() != '\0')
            throw error();
        return jval;
    }

private:
    JsonReader           (const JsonReader&) = delete;
    JsonReader& operator=(const JsonReader&) = delete;

    //returns next char without consuming it; '\0' at end of stream
    char skipWhiteSpace()
    {
        while (pos_ < stream_.size() && (stream_[pos_] == ' ' || stream_[pos_] == '\t' || isLineBreak(stream_[pos_])))
            ++pos_;
        return pos_ < stream_.size() ? stream_[pos_] : '\0';
    }

    void expectChar(char c) //throw JsonParsingError
    {
        if (skipWhiteSpace() != c)
            throw error();
        ++pos_;
    }

    JsonValue readValue() //throw JsonParsingError
    {
        switch (skipWhiteSpace())
        {
            case '{':
                return readObject(); //throw JsonParsingError
            case '[':
                return readArray(); //throw JsonParsingError
            case '"':
            {
                JsonValue jval(JsonValue::Type::string);
                jval.primVal = readString(); //throw JsonParsingError
                return jval;
            }
        }

        for (const auto& [literal, type] : {std::pair{"true", JsonValue::Type::boolean},
                                             std::pair{"false", JsonValue::Type::boolean},
                                             std::pair{"null", JsonValue::Type::null}})
            if (hvk::startsWith(stream_.substr(pos_), literal))
            {
                JsonValue jval(type);
                if (type == JsonValue::Type::boolean)
                    jval.primVal = literal;
                pos_ += std::string_view(literal).size();
                return jval;
            }

        //number: validated by the consumer
        const size_t numEnd = std::min(stream_.find_first_not_of("0123456789+-.eE", pos_), stream_.size());
        if (numEnd == pos_)
            throw error();

        JsonValue jval(JsonValue::Type::number);
        jval.primVal = stream_.substr(pos_, numEnd - pos_);
        pos_ = numEnd;
        return jval;
    }

    JsonValue readObject() //throw JsonParsingError
    {
        expectChar('{'); //throw JsonParsingError
        JsonValue jval(JsonValue::Type::object);

        if (skipWhiteSpace() == '}')
            return ++pos_, jval;
        for (;;)
        {
            if (skipWhiteSpace() != '"')
                throw error();
            std::string name = readString(); //throw JsonParsingError
            expectChar(':');                 //

            JsonValue value = readValue(); //throw JsonParsingError
            jval.objectVal.emplace(std::move(name), std::move(value));

            if (skipWhiteSpace() != ',')
                break;
            ++pos_;
        }
        expectChar('}'); //throw JsonParsingError
        return jval;
    }

    JsonValue readArray() //throw JsonParsingError
    {
        expectChar('['); //throw JsonParsingError
        JsonValue jval(JsonValue::Type::array);

        if (skipWhiteSpace() == ']')
            return ++pos_, jval;
        for (;;)
        {
            jval.arrayVal.push_back(readValue()); //throw JsonParsingError

            if (skipWhiteSpace() != ',')
                break;
            ++pos_;
        }
        expectChar(']'); //throw JsonParsingError
        return jval;
    }

    //at opening quote
    std::string readString() //throw JsonParsingError
    {
        std::string output;
        for (++pos_; pos_ < stream_.size(); ++pos_)
        {
            const char c = stream_[pos_];
            if (c == '"')
            {
                ++pos_;
                return output;
            }
            if (c != '\\')
            {
                output += c;
                continue;
            }

            if (++pos_ == stream_.size())
                break;

            switch (const char esc = stream_[pos_])
            {
                case 'b': output += '\b'; break;
                case 'f': output += '\f'; break;
                case 'n': output += '\n'; break;
                case 'r': output += '\r'; break;
                case 't': output += '\t'; break;
                case 'u':
                    impl::codePointToUtf8(readEscapedCodePoint(), output); //throw JsonParsingError
                    break;
                default: //'"', '\\', '/' and unknown escapes: take literally
                    output += esc;
                    break;
            }
        }
        throw error(); //unterminated string
    }

    //at 'u' of "\uXXXX", combines surrogate pairs; leaves pos_ at the last hex digit
    impl::CodePoint readEscapedCodePoint() //throw JsonParsingError
    {
        auto readUnit = [&]
        {
            if (stream_.size() - pos_ < 5)
                throw error();

            impl::CodePoint unit = 0;
            for (const char c : stream_.substr(pos_ + 1, 4))
            {
                const int digit = isDigit(c) ? c - '0' :
                                  'a' <= c && c <= 'f' ? c - 'a' + 10 :
                                  'A' <= c && c <= 'F' ? c - 'A' + 10 : -1;
                if (digit < 0)
                    throw error();
                unit = unit * 16 + digit;
            }
            pos_ += 4;
            return unit;
        };

        const impl::CodePoint high = readUnit(); //throw JsonParsingError
        if (0xd800 <= high && high < 0xdc00 && hvk::startsWith(stream_.substr(pos_ + 1), "\\u"))
        {
            const size_t posHigh = pos_;
            pos_ += 2;
            if (const impl::CodePoint low = readUnit(); //throw JsonParsingError
                0xdc00 <= low && low < 0xe000)
                return 0x10000 + ((high - 0xd800) << 10) + (low - 0xdc00);
            pos_ = posHigh;
        }
        return 0xd800 <= high && high < 0xe000 ? impl::REPLACEMENT_CHAR : high; //unpaired surrogate
    }

    JsonParsingError error() const
    {
        const std::string_view consumed = stream_.substr(0, pos_);
        const size_t lineStart = consumed.find_last_of('\n');

        return JsonParsingError(std::count(consumed.begin(), consumed.end(), '\n'),
                                lineStart == std::string_view::npos ? pos_ : pos_ - lineStart - 1);
    }

    const std::string_view stream_;
    size_t pos_ = 0;
};
}


inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonReader(stream).readDocument(); //throw JsonParsingError
}
}

#endif //JSON_H_0187348321748321758934215734
