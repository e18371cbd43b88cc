#include <gtest/gtest.h>
#include "tether/network/envelope.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace tether::network;
using json = nlohmann::json;

class EnvelopeTest : public ::testing::Test {
protected:
    template<typename T>
    T decode_as(const std::string& text) {
        auto envelope = decode_envelope(text);
        EXPECT_TRUE(std::holds_alternative<T>(envelope)) << "decoded as " << envelope_type_name(envelope);
        return std::holds_alternative<T>(envelope) ? std::get<T>(envelope) : T{};
    }
    
    std::string malformed_reason(const std::string& text) {
        auto envelope = decode_envelope(text);
        auto* malformed = std::get_if<MalformedMessage>(&envelope);
        return malformed ? malformed->reason : "";
    }
};

TEST_F(EnvelopeTest, EncodesWireFieldNames) {
    auto chunk = json::parse(encode_envelope(ChunkMessage{"download_1_ab", 7, "AAEC", "laptop"}));
    EXPECT_EQ(chunk["type"], "file-chunk");
    EXPECT_EQ(chunk["downloadId"], "download_1_ab");
    EXPECT_EQ(chunk["chunkIndex"], 7);
    EXPECT_EQ(chunk["chunk"], "AAEC");
    EXPECT_EQ(chunk["clientId"], "laptop");
    
    auto complete = json::parse(encode_envelope(CompleteMessage{"download_1_ab", 160, 10485760, std::nullopt}));
    EXPECT_EQ(complete["type"], "file-complete");
    EXPECT_EQ(complete["totalChunks"], 160);
    EXPECT_EQ(complete["fileSize"], 10485760);
    EXPECT_FALSE(complete.contains("clientId"));
    
    auto request = json::parse(encode_envelope(DownloadRequestMessage{"download_1_ab"}));
    EXPECT_EQ(request["type"], "download-request");
    EXPECT_EQ(request["downloadId"], "download_1_ab");
    
    auto reg = json::parse(encode_envelope(RegisterMessage{"laptop"}));
    EXPECT_EQ(reg["type"], "register");
    EXPECT_EQ(reg["clientId"], "laptop");
}

TEST_F(EnvelopeTest, ErrorWithoutSession) {
    auto error = json::parse(encode_envelope(ErrorMessage{std::nullopt, "File not found", std::nullopt}));
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["error"], "File not found");
    EXPECT_FALSE(error.contains("downloadId"));
    
    auto decoded = decode_as<ErrorMessage>(R"({"type":"error","error":"disk full"})");
    EXPECT_FALSE(decoded.session_id.has_value());
    EXPECT_EQ(decoded.message, "disk full");
}

TEST_F(EnvelopeTest, DecodesMessagesFromOtherEncoders) {
    auto chunk = decode_as<ChunkMessage>(
        R"({"type":"file-chunk","downloadId":"d1","chunkIndex":0,"chunk":"aGk=","clientId":"c1"})");
    EXPECT_EQ(chunk.session_id, "d1");
    EXPECT_EQ(chunk.sequence_index, 0u);
    ASSERT_TRUE(chunk.client_id.has_value());
    EXPECT_EQ(*chunk.client_id, "c1");
    
    auto payload = chunk.decode_payload();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(std::string(payload->begin(), payload->end()), "hi");
    
    auto complete = decode_as<CompleteMessage>(
        R"({"type":"file-complete","downloadId":"d1","totalChunks":0,"fileSize":0})");
    EXPECT_EQ(complete.total_chunks, 0u);
    EXPECT_EQ(complete.total_bytes, 0u);
    
    auto registered = decode_as<RegisteredMessage>(R"({"type":"registered","clientId":"c1"})");
    EXPECT_EQ(registered.client_id, "c1");
}

TEST_F(EnvelopeTest, UnknownFieldsAreIgnored) {
    auto reg = decode_as<RegisterMessage>(R"({"type":"register","clientId":"c1","extra":[1,2]})");
    EXPECT_EQ(reg.client_id, "c1");
}

TEST_F(EnvelopeTest, MalformedInputs) {
    EXPECT_EQ(malformed_reason("not json"), "payload is not valid JSON");
    EXPECT_EQ(malformed_reason("[1,2,3]"), "payload is not a JSON object");
    EXPECT_EQ(malformed_reason(R"({"clientId":"c1"})"), "missing message type");
    EXPECT_EQ(malformed_reason(R"({"type":"teleport"})"), "unknown message type 'teleport'");
    
    EXPECT_FALSE(malformed_reason(R"({"type":"register"})").empty());
    EXPECT_FALSE(malformed_reason(R"({"type":"file-chunk","downloadId":"d1","chunk":"aGk="})").empty());
    EXPECT_FALSE(malformed_reason(R"({"type":"file-chunk","downloadId":"d1","chunkIndex":-1,"chunk":""})").empty());
    EXPECT_FALSE(malformed_reason(R"({"type":"file-complete","downloadId":"d1","totalChunks":"3","fileSize":9})").empty());
    EXPECT_FALSE(malformed_reason(R"({"type":"error","downloadId":5,"error":"x"})").empty());
}

TEST_F(EnvelopeTest, MalformedCannotBeEncoded) {
    EXPECT_THROW(encode_envelope(MalformedMessage{"bad"}), std::logic_error);
}

TEST_F(EnvelopeTest, RoundTripPreservesBytes) {
    std::vector<std::uint8_t> bytes = {0x00, 0xff, 0x10, 0x80, 0x7f};
    auto original = ChunkMessage::from_bytes("d9", 41, bytes);
    
    auto decoded = decode_as<ChunkMessage>(encode_envelope(original));
    EXPECT_EQ(decoded.sequence_index, 41u);
    EXPECT_EQ(decoded.decode_payload(), bytes);
}

TEST_F(EnvelopeTest, TypeNamesAndSessionIds) {
    EXPECT_STREQ(envelope_type_name(Envelope{ChunkMessage{}}), "CHUNK");
    EXPECT_STREQ(envelope_type_name(Envelope{MalformedMessage{}}), "MALFORMED");
    
    EXPECT_EQ(envelope_session_id(Envelope{DownloadRequestMessage{"d1"}}), std::optional<std::string>("d1"));
    EXPECT_FALSE(envelope_session_id(Envelope{RegisterMessage{"c1"}}).has_value());
    EXPECT_FALSE(envelope_session_id(Envelope{ErrorMessage{}}).has_value());
}
