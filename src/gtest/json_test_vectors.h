#ifndef SHIELDPOOL_GTEST_JSON_TEST_VECTORS_H
#define SHIELDPOOL_GTEST_JSON_TEST_VECTORS_H

#include <gtest/gtest.h>

#include "uint256.h"
#include "utilstrencodings.h"

#include <string>

#include <univalue.h>

// The build turns each test/data/<name>.json into test/data/<name>.json.h,
// which defines json_tests::<name> as the raw bytes of the file.
#define JSON_TEST_DATA(name) \
    std::string(json_tests::name, json_tests::name + sizeof(json_tests::name))

UniValue
read_json(const std::string& jsondata);

UniValue
read_json_object(const std::string& jsondata);

/** A 32-byte big-endian hex string as a field element. */
uint256 uint256_from_json(const UniValue& v);

/** Hex string to raw bytes; fails the test on odd or non-hex input. */
std::vector<unsigned char> bytes_from_json(const UniValue& v);

#endif // SHIELDPOOL_GTEST_JSON_TEST_VECTORS_H
