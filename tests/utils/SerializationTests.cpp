/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SerializationTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/Compression.hpp"
#include "utils/JsonReader.hpp"

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace Realmforge;

namespace {

JsonValue makeTree() {
    JsonObject weather;
    weather["condition"] = JsonValue("rainy");
    weather["temperature"] = JsonValue(51.75);

    JsonObject root;
    root["zeta"] = JsonValue("first key");
    root["alpha"] = JsonValue(true);
    root["count"] = JsonValue(int64_t{9007199254740991LL});
    root["nothing"] = JsonValue();
    root["weather"] = JsonValue(std::move(weather));
    root["tags"] = JsonValue(JsonArray{JsonValue("smoky"), JsonValue(3), JsonValue(false)});
    root["empty"] = JsonValue(JsonArray{});
    return JsonValue(std::move(root));
}

std::string encode(const JsonValue &value) {
    auto stream = std::make_shared<std::ostringstream>(std::ios::binary);
    {
        BinarySerial::Writer writer(stream);
        BOOST_REQUIRE(writer.writeJson(value));
    }
    return stream->str();
}

bool decode(const std::string &bytes, JsonValue &value) {
    auto stream = std::make_shared<std::istringstream>(bytes, std::ios::binary);
    BinarySerial::Reader reader(stream);
    return reader.readJson(value);
}

} // namespace

// ============================================================================
// BINARY SERIALIZER TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(BinarySerializerTests)

BOOST_AUTO_TEST_CASE(TestJsonTreeRoundTrip) {
    const JsonValue tree = makeTree();
    JsonValue decoded;
    BOOST_REQUIRE(decode(encode(tree), decoded));
    BOOST_CHECK(decoded == tree);

    // Member order survives the binary form
    const JsonObject &obj = decoded.asObject();
    BOOST_REQUIRE(!obj.empty());
    BOOST_CHECK_EQUAL(obj.begin()->first, "zeta");
}

BOOST_AUTO_TEST_CASE(TestPrimitivesAndVectors) {
    auto out = std::make_shared<std::ostringstream>(std::ios::binary);
    {
        BinarySerial::Writer writer(out);
        BOOST_CHECK(writer.write(uint32_t{0xCAFE}));
        BOOST_CHECK(writer.writeString("Stonecross"));
        BOOST_CHECK(writer.writeString(""));
        BOOST_CHECK(writer.writeVector(std::vector<double>{1.5, -2.0}));
    }

    auto in = std::make_shared<std::istringstream>(out->str(), std::ios::binary);
    BinarySerial::Reader reader(in);
    uint32_t tag = 0;
    std::string name = "stale";
    std::string empty = "stale";
    std::vector<double> values;
    BOOST_CHECK(reader.read(tag));
    BOOST_CHECK(reader.readString(name));
    BOOST_CHECK(reader.readString(empty));
    BOOST_CHECK(reader.readVector(values));

    BOOST_CHECK_EQUAL(tag, 0xCAFEu);
    BOOST_CHECK_EQUAL(name, "Stonecross");
    BOOST_CHECK(empty.empty());
    BOOST_REQUIRE_EQUAL(values.size(), 2u);
    BOOST_CHECK_EQUAL(values[1], -2.0);
}

BOOST_AUTO_TEST_CASE(TestTruncatedInputFails) {
    REALM_ENABLE_BENCHMARK_MODE();
    const std::string bytes = encode(makeTree());
    for (size_t cut : {size_t{1}, bytes.size() / 2, bytes.size() - 1}) {
        JsonValue decoded;
        BOOST_CHECK(!decode(bytes.substr(0, cut), decoded));
    }
    REALM_DISABLE_BENCHMARK_MODE();
}

BOOST_AUTO_TEST_CASE(TestUnknownTagAndHugeLengthFail) {
    REALM_ENABLE_BENCHMARK_MODE();
    JsonValue decoded;
    BOOST_CHECK(!decode(std::string(1, '\x7f'), decoded));

    // String node claiming more than the allowed length
    std::string bytes(1, static_cast<char>(JsonType::String));
    const uint32_t huge = BinarySerial::MAX_STRING_LENGTH + 1;
    bytes.append(reinterpret_cast<const char *>(&huge), sizeof(huge));
    BOOST_CHECK(!decode(bytes, decoded));
    REALM_DISABLE_BENCHMARK_MODE();
}

BOOST_AUTO_TEST_CASE(TestInvalidStreamsThrow) {
    BOOST_CHECK_THROW(BinarySerial::Writer(std::shared_ptr<std::ostream>()),
                      std::runtime_error);
    BOOST_CHECK_THROW(BinarySerial::Reader(std::shared_ptr<std::istream>()),
                      std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// COMPRESSION TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(CompressionTests)

BOOST_AUTO_TEST_CASE(TestGzipRoundTrip) {
    std::string text;
    for (int i = 0; i < 500; ++i) {
        text += "The smith hammers a gleaming iron blade. ";
    }

    std::string packed;
    BOOST_REQUIRE(Compression::gzipCompress(text, packed));
    BOOST_CHECK(Compression::isGzipData(packed));
    BOOST_CHECK_LT(packed.size(), text.size());

    std::string unpacked;
    BOOST_REQUIRE(Compression::gzipDecompress(packed, unpacked));
    BOOST_CHECK(unpacked == text);
}

BOOST_AUTO_TEST_CASE(TestEmptyAndBinaryPayloads) {
    std::string packed;
    std::string unpacked = "stale";
    BOOST_REQUIRE(Compression::gzipCompress("", packed));
    BOOST_REQUIRE(Compression::gzipDecompress(packed, unpacked));
    BOOST_CHECK(unpacked.empty());

    const std::string binary("\x00\x01\xff\x1f\x8b\x00", 6);
    BOOST_REQUIRE(Compression::gzipCompress(binary, packed, 9));
    BOOST_REQUIRE(Compression::gzipDecompress(packed, unpacked));
    BOOST_CHECK(unpacked == binary);
}

BOOST_AUTO_TEST_CASE(TestCorruptInputFails) {
    REALM_ENABLE_BENCHMARK_MODE();
    std::string output = "untouched";
    BOOST_CHECK(!Compression::gzipDecompress("plain text, not gzip", output));
    BOOST_CHECK_EQUAL(output, "untouched");

    std::string packed;
    BOOST_REQUIRE(Compression::gzipCompress(std::string(2048, 'x'), packed));
    BOOST_CHECK(!Compression::gzipDecompress(packed.substr(0, packed.size() / 2), output));

    BOOST_CHECK(!Compression::isGzipData("\x1f"));
    BOOST_CHECK(!Compression::isGzipData("{\"version\": 1}"));
    REALM_DISABLE_BENCHMARK_MODE();
}

BOOST_AUTO_TEST_SUITE_END()
