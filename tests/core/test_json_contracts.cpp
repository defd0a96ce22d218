// test_json_contracts.cpp — Тесты формата pairing сообщений и сборки JSON из потока
// Ключи и значения должны совпадать с тем, что шлют другие реализации протокола

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "oreonpickup/Network/PairingProtocol.h"

using json = nlohmann::json;

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// PairingRequest
// ═══════════════════════════════════════════════════════════

TEST(PairingRequestJsonTest, HasExactWireShape) {
    PairingRequest request;
    request.code = "1234";
    request.hostname = "alice-laptop";

    auto j = json::parse(request.toJson());
    EXPECT_EQ(j, json::parse(R"({"type":"pairing_request","code":"1234","hostname":"alice-laptop"})"));
    EXPECT_TRUE(j["code"].is_string());     // Код строкой, не числом
}

TEST(PairingRequestJsonTest, ParsesPeerRequest) {
    auto request = PairingRequest::fromJson(
        R"({"type":"pairing_request","code":"0007","hostname":"bob"})");

    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->isPairingRequest());
    EXPECT_EQ(request->code, "0007");
    EXPECT_EQ(request->hostname, "bob");
}

TEST(PairingRequestJsonTest, WrongTypeIsNotPairingRequest) {
    auto request = PairingRequest::fromJson(R"({"type":"hello","code":"1234"})");
    ASSERT_TRUE(request.has_value());
    EXPECT_FALSE(request->isPairingRequest());
}

TEST(PairingRequestJsonTest, RejectsNonObjects) {
    EXPECT_FALSE(PairingRequest::fromJson("not json").has_value());
    EXPECT_FALSE(PairingRequest::fromJson("[1,2,3]").has_value());
    EXPECT_FALSE(PairingRequest::fromJson(R"("pairing_request")").has_value());
}

TEST(PairingRequestJsonTest, RejectsWrongFieldTypes) {
    // Числовой код — нарушение протокола
    EXPECT_FALSE(PairingRequest::fromJson(R"({"type":"pairing_request","code":1234})").has_value());
}

// ═══════════════════════════════════════════════════════════
// PairingConfirm
// ═══════════════════════════════════════════════════════════

TEST(PairingConfirmJsonTest, SuccessShape) {
    auto j = json::parse(PairingConfirm::accepted("bob-desktop").toJson());
    EXPECT_EQ(j, json::parse(R"({"type":"pairing_confirm","status":"success","hostname":"bob-desktop"})"));
}

TEST(PairingConfirmJsonTest, FailureShape) {
    auto j = json::parse(PairingConfirm::rejected(REASON_INVALID_CODE).toJson());
    EXPECT_EQ(j, json::parse(R"({"type":"pairing_confirm","status":"failure","reason":"Invalid code"})"));
}

TEST(PairingConfirmJsonTest, ParsesSuccess) {
    auto confirm = PairingConfirm::fromJson(
        R"({"type":"pairing_confirm","status":"success","hostname":"bob-desktop"})");
    ASSERT_TRUE(confirm.has_value());
    EXPECT_TRUE(confirm->success);
    EXPECT_EQ(confirm->hostname, "bob-desktop");
}

TEST(PairingConfirmJsonTest, FailureWithoutReasonIsUnknown) {
    auto confirm = PairingConfirm::fromJson(R"({"type":"pairing_confirm","status":"failure"})");
    ASSERT_TRUE(confirm.has_value());
    EXPECT_FALSE(confirm->success);
    EXPECT_EQ(confirm->reason, "Unknown");
}

TEST(PairingConfirmJsonTest, SuccessRequiresConfirmType) {
    auto confirm = PairingConfirm::fromJson(R"({"type":"other","status":"success"})");
    ASSERT_TRUE(confirm.has_value());
    EXPECT_FALSE(confirm->success);
}

// ═══════════════════════════════════════════════════════════
// JsonMessageReader
// ═══════════════════════════════════════════════════════════

TEST(JsonMessageReaderTest, CompleteInOneChunk) {
    JsonMessageReader reader;
    std::string doc = R"({"type":"pairing_request","code":"1234","hostname":"a"})";

    EXPECT_EQ(reader.feed(doc.data(), doc.size()), JsonMessageReader::Status::Complete);
    EXPECT_EQ(reader.document(), doc);
}

TEST(JsonMessageReaderTest, ByteByByte) {
    JsonMessageReader reader;
    std::string doc = R"({"type":"pairing_confirm","status":"success","hostname":"b"})";

    for (size_t i = 0; i + 1 < doc.size(); ++i) {
        ASSERT_EQ(reader.feed(&doc[i], 1), JsonMessageReader::Status::Incomplete) << "at byte " << i;
    }
    EXPECT_EQ(reader.feed(&doc.back(), 1), JsonMessageReader::Status::Complete);
}

TEST(JsonMessageReaderTest, BraceInsideStringDoesNotComplete) {
    JsonMessageReader reader;
    std::string part = R"({"hostname":"a}b")";

    EXPECT_EQ(reader.feed(part.data(), part.size()), JsonMessageReader::Status::Incomplete);
    EXPECT_EQ(reader.feed("}", 1), JsonMessageReader::Status::Complete);
}

TEST(JsonMessageReaderTest, LeadingGarbageIsMalformed) {
    JsonMessageReader reader;
    EXPECT_EQ(reader.feed("GET / HTTP/1.1", 14), JsonMessageReader::Status::Malformed);
}

TEST(JsonMessageReaderTest, LeadingWhitespaceIsAllowed) {
    JsonMessageReader reader;
    std::string doc = "  \n{\"a\":1}";
    EXPECT_EQ(reader.feed(doc.data(), doc.size()), JsonMessageReader::Status::Complete);
}

TEST(JsonMessageReaderTest, OversizedMessageIsMalformed) {
    JsonMessageReader reader(64);
    std::string doc = "{\"pad\":\"" + std::string(100, 'x');

    EXPECT_EQ(reader.feed(doc.data(), doc.size()), JsonMessageReader::Status::Malformed);
}

TEST(JsonMessageReaderTest, FinishTurnsIncompleteIntoMalformed) {
    JsonMessageReader reader;
    std::string part = R"({"type":"pairing_req)";

    EXPECT_EQ(reader.feed(part.data(), part.size()), JsonMessageReader::Status::Incomplete);
    EXPECT_EQ(reader.finish(), JsonMessageReader::Status::Malformed);

    // Статус окончательный
    EXPECT_EQ(reader.feed("\"}", 2), JsonMessageReader::Status::Malformed);
}

TEST(JsonMessageReaderTest, FinishAfterCompleteStaysComplete) {
    JsonMessageReader reader;
    EXPECT_EQ(reader.feed("{}", 2), JsonMessageReader::Status::Complete);
    EXPECT_EQ(reader.finish(), JsonMessageReader::Status::Complete);
}

} // namespace OreonPickup
