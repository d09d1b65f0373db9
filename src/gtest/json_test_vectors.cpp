#include "json_test_vectors.h"

UniValue
read_json(const std::string& jsondata)
{
    UniValue v;

    if (!(v.read(jsondata) && v.isArray()))
    {
        ADD_FAILURE();
        return UniValue(UniValue::VARR);
    }
    return v.get_array();
}

UniValue
read_json_object(const std::string& jsondata)
{
    UniValue v;

    if (!(v.read(jsondata) && v.isObject()))
    {
        ADD_FAILURE();
        return UniValue(UniValue::VOBJ);
    }
    return v.get_obj();
}

uint256 uint256_from_json(const UniValue& v)
{
    EXPECT_TRUE(v.isStr());
    EXPECT_EQ(v.get_str().size(), 64u);
    return uint256S(v.get_str());
}

std::vector<unsigned char> bytes_from_json(const UniValue& v)
{
    EXPECT_TRUE(v.isStr());
    EXPECT_TRUE(IsHex(v.get_str()) || v.get_str().empty());
    return ParseHex(v.get_str());
}
