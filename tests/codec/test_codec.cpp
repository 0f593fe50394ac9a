/*
================================================================================
 richenum::codec — JSON Encode / Decode Unit Tests
================================================================================

These tests validate the in-memory JSON representation of entry lists.

Design goals enforced by this test suite:
  • Deterministic, pretty-printed output with stable key order
  • Canonical lowercase oids
  • Texts that are not valid UTF-8 are refused at encode time
  • Lenient field-name casing on input, strict field types and ranges
  • decode() never throws and leaves its output untouched on failure

Stream and file wrappers are covered by test_codec_io.
================================================================================
*/

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "richenum/codec.hpp"
#include "common/test_check.hpp"

using namespace richenum;

namespace {

EnumEntry make_entry(std::string text, std::int32_t value, std::int32_t index, bool visible) {
    EnumEntry e;
    e.text = std::move(text);
    e.value = value;
    e.index = index;
    e.oid = oid::parse("3fa85f64-5717-4562-b3fc-2c963f66afa6");
    e.is_visible = visible;
    return e;
}

} // namespace


void test_encode_format() {
    std::cout << "[TEST] Encode (pretty format, key order)..." << std::endl;

    const std::string json = codec::encode({make_entry("Shipped", 42, 7, true)});

    const std::string expected =
        "[\n"
        "  {\n"
        "    \"text\": \"Shipped\",\n"
        "    \"value\": 42,\n"
        "    \"index\": 7,\n"
        "    \"oid\": \"3fa85f64-5717-4562-b3fc-2c963f66afa6\",\n"
        "    \"isVisible\": true\n"
        "  }\n"
        "]";
    TEST_CHECK(json == expected);

    std::cout << "[TEST] OK\n";
}

void test_encode_empty() {
    std::cout << "[TEST] Encode (empty list)..." << std::endl;

    TEST_CHECK(codec::encode({}) == "[]");

    std::vector<EnumEntry> out{make_entry("x", 1, 1, true)};
    TEST_CHECK(codec::decode("[]", out) == codec::Result::Ok);
    TEST_CHECK(out.empty());

    std::cout << "[TEST] OK\n";
}

void test_encode_escaping() {
    std::cout << "[TEST] Encode (escaped text, extreme numbers)..." << std::endl;

    const std::vector<EnumEntry> entries{
        make_entry("say \"hi\"\\\n", -2147483647 - 1, 2147483647, false)
    };
    const std::string json = codec::encode(entries);

    TEST_CHECK(json.find("\"text\": \"say \\\"hi\\\"\\\\\\n\"") != std::string::npos);
    TEST_CHECK(json.find("\"value\": -2147483648") != std::string::npos);
    TEST_CHECK(json.find("\"index\": 2147483647") != std::string::npos);
    TEST_CHECK(json.find("\"isVisible\": false") != std::string::npos);

    std::vector<EnumEntry> back;
    TEST_CHECK(codec::decode(json, back) == codec::Result::Ok);
    TEST_CHECK(back == entries);

    std::cout << "[TEST] OK\n";
}

void test_encode_utf8() {
    std::cout << "[TEST] Encode (UTF-8 texts)..." << std::endl;

    const std::vector<EnumEntry> accented{make_entry("Caf\xc3\xa9", 3, 3, true)};
    std::vector<EnumEntry> back;
    TEST_CHECK(codec::decode(codec::encode(accented), back) == codec::Result::Ok);
    TEST_CHECK(back == accented);

    // invalid byte, truncated sequence
    TEST_CHECK_THROWS((codec::encode({make_entry("bad\xff", 1, 1, true)})), error_code::invalid_argument);
    TEST_CHECK_THROWS((codec::encode({make_entry("ok", 1, 1, true), make_entry("Caf\xc3", 2, 2, true)})),
                      error_code::invalid_argument);

    std::cout << "[TEST] OK\n";
}

void test_decode_case_insensitive_keys() {
    std::cout << "[TEST] Decode (case-insensitive field names)..." << std::endl;

    const std::string json = R"([
        {"Text":"Pending","VALUE":10,"Index":-3,"OID":"{3FA85F64-5717-4562-B3FC-2C963F66AFA6}","isvisible":false,"extra":1}
    ])";

    std::vector<EnumEntry> out;
    TEST_CHECK(codec::decode(json, out) == codec::Result::Ok);
    TEST_CHECK(out.size() == 1);
    TEST_CHECK(out[0].text == "Pending");
    TEST_CHECK(out[0].value == 10);
    TEST_CHECK(out[0].index == -3);
    TEST_CHECK(oid::to_string(out[0].oid) == "3fa85f64-5717-4562-b3fc-2c963f66afa6");
    TEST_CHECK(!out[0].is_visible);

    std::cout << "[TEST] OK\n";
}

void test_decode_failures() {
    std::cout << "[TEST] Decode (failures leave output untouched)..." << std::endl;

    const std::vector<EnumEntry> sentinel{make_entry("keep", 1, 1, true)};
    std::vector<EnumEntry> out = sentinel;

    // structural
    TEST_CHECK(codec::decode("", out) == codec::Result::InvalidJson);
    TEST_CHECK(codec::decode("[{", out) == codec::Result::InvalidJson);

    // schema
    TEST_CHECK(codec::decode("{}", out) == codec::Result::InvalidSchema);
    TEST_CHECK(codec::decode("[1]", out) == codec::Result::InvalidSchema);
    TEST_CHECK(codec::decode(R"([{"text":"a","value":1,"index":1,"isVisible":true}])", out)
               == codec::Result::InvalidSchema);
    TEST_CHECK(codec::decode(R"([{"text":"a","value":"1","index":1,"oid":"3fa85f64-5717-4562-b3fc-2c963f66afa6","isVisible":true}])", out)
               == codec::Result::InvalidSchema);
    TEST_CHECK(codec::decode(R"([{"text":"a","value":1,"index":1,"oid":"3fa85f64-5717-4562-b3fc-2c963f66afa6","isVisible":1}])", out)
               == codec::Result::InvalidSchema);

    // values
    TEST_CHECK(codec::decode(R"([{"text":"a","value":2147483648,"index":1,"oid":"3fa85f64-5717-4562-b3fc-2c963f66afa6","isVisible":true}])", out)
               == codec::Result::InvalidValue);
    TEST_CHECK(codec::decode(R"([{"text":"a","value":1.5,"index":1,"oid":"3fa85f64-5717-4562-b3fc-2c963f66afa6","isVisible":true}])", out)
               == codec::Result::InvalidValue);
    TEST_CHECK(codec::decode(R"([{"text":"a","value":1,"index":1,"oid":"nope","isVisible":true}])", out)
               == codec::Result::InvalidValue);

    TEST_CHECK(out == sentinel);

    std::cout << "[TEST] OK\n";
}

void test_result_to_string() {
    std::cout << "[TEST] Result names..." << std::endl;

    TEST_CHECK(codec::to_string(codec::Result::Ok) == "Ok");
    TEST_CHECK(codec::to_string(codec::Result::InvalidSchema) == "InvalidSchema");
    TEST_CHECK(to_string(error_code::invalid_json) == "invalid_json");

    std::cout << "[TEST] OK\n";
}


int main() {
    test_encode_format();
    test_encode_empty();
    test_encode_escaping();
    test_encode_utf8();
    test_decode_case_insensitive_keys();
    test_decode_failures();
    test_result_to_string();

    std::cout << "[TEST] ALL CODEC TESTS PASSED!\n";
    return 0;
}
