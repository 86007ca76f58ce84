#include "ixcp/network/http_router.hpp"
#include "ixcp/network/upload_protocol.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace ixcp::network;
using ixcp::Bytes;
using ixcp::ErrorCode;
using nlohmann::json;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

HttpResponse text(const std::string& body) {
    HttpResponse response(HttpStatus::OK);
    response.set_body(body);
    return response;
}

} // namespace

// ════════════════════════════════════════════════════════
// Router
// ════════════════════════════════════════════════════════

TEST(HttpRouterTest, DispatchesByMethodAndPath) {
    HttpRouter router;
    router.get("/upload/status", [](const HttpContext&) { return text("status"); });
    router.post("/upload", [](const HttpContext&) { return text("upload"); });
    router.delete_("/upload", [](const HttpContext&) { return text("delete"); });

    EXPECT_EQ(router.route_count(), 3u);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/upload/status?filename=a")).body_as_string(),
              "status");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::POST, "/upload")).body_as_string(), "upload");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::DELETE_METHOD, "/upload?filename=a"))
                  .body_as_string(), "delete");

    auto routes = router.list_routes();
    ASSERT_EQ(routes.size(), 3u);
    EXPECT_EQ(routes[0], "GET /upload/status");
}

TEST(HttpRouterTest, UnknownPathIs404AndWrongMethodIs405) {
    HttpRouter router;
    router.post("/upload", [](const HttpContext&) { return text("upload"); });

    auto missing = router.handle_request(make_request(HttpMethod::GET, "/nowhere"));
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_EQ(protocol::error_message(missing), "No route for /nowhere");

    auto wrong = router.handle_request(make_request(HttpMethod::PUT, "/upload"));
    EXPECT_EQ(wrong.status_code, 405);

    router.set_not_found_handler([](const HttpContext&) {
        HttpResponse response(HttpStatus::NOT_FOUND);
        response.set_body("custom");
        return response;
    });
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/nowhere")).body_as_string(), "custom");
}

TEST(HttpRouterTest, PathsMatchExactly) {
    HttpRouter router;
    router.get("/upload/status", [](const HttpContext&) { return text("status"); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/upload/status")).status_code, 200);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/upload/status/")).status_code, 404);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/upload")).status_code, 404);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/upload/statusx")).status_code, 404);
}

TEST(HttpRouterTest, PreflightBypassesMiddleware) {
    HttpRouter router;
    int middleware_calls = 0;
    router.use([&middleware_calls](const HttpContext&, HttpResponse& response) {
        ++middleware_calls;
        response = HttpResponse(HttpStatus::UNAUTHORIZED);
        return false;
    });
    router.post("/upload", [](const HttpContext&) { return text("upload"); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::OPTIONS, "/upload")).status_code, 204);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::OPTIONS, "/elsewhere")).status_code, 404);
    EXPECT_EQ(middleware_calls, 0);

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::POST, "/upload")).status_code, 401);
    EXPECT_EQ(middleware_calls, 1);
}

TEST(HttpRouterTest, FiltersApplyToEveryResponse) {
    HttpRouter router;
    router.add_response_filter([](const HttpRequest&, HttpResponse& response) {
        response.set_header("Access-Control-Allow-Origin", "*");
    });
    router.get("/public-key", [](const HttpContext&) { return text("key"); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/public-key"))
                  .get_header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/missing"))
                  .get_header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::OPTIONS, "/public-key"))
                  .get_header("Access-Control-Allow-Origin"), "*");
}

TEST(HttpRouterTest, HandlerExceptionBecomes500) {
    HttpRouter router;
    router.get("/boom", [](const HttpContext&) -> HttpResponse {
        throw std::runtime_error("kaboom");
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 500);
    EXPECT_EQ(protocol::error_message(response), "Internal server error");
}

// ════════════════════════════════════════════════════════
// Upload wire format
// ════════════════════════════════════════════════════════

TEST(UploadProtocolTest, PacketTravelsThroughHeaders) {
    ixcp::transfer::EncryptedPacket packet;
    packet.session_id = "0123abcd";
    packet.file_name = "report final.pdf";
    packet.sequence_index = 42;
    packet.key_id = "kid";
    packet.wrapped_key = Bytes{1, 2, 3, 250};
    packet.nonce = Bytes(12, 0xAB);
    packet.auth_tag = Bytes(16, 0x01);
    packet.ciphertext = Bytes{9, 8, 7};

    auto request = protocol::encode_upload(packet, "secret");
    EXPECT_EQ(request.url, protocol::kUploadPath);
    EXPECT_EQ(protocol::bearer_token(request).value(), "secret");
    EXPECT_EQ(request.get_header(protocol::kHeaderChunkIndex), "42");
    EXPECT_EQ(request.get_header(protocol::kHeaderNonce), "abababababababababababab");

    auto decoded = protocol::decode_upload(request);
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
    EXPECT_EQ(decoded.value().file_name, packet.file_name);
    EXPECT_EQ(decoded.value().sequence_index, 42u);
    EXPECT_EQ(decoded.value().wrapped_key, packet.wrapped_key);
    EXPECT_EQ(decoded.value().nonce, packet.nonce);
    EXPECT_EQ(decoded.value().auth_tag, packet.auth_tag);
    EXPECT_EQ(decoded.value().ciphertext, packet.ciphertext);
}

TEST(UploadProtocolTest, MissingOrMalformedHeadersAreRejected) {
    ixcp::transfer::EncryptedPacket packet;
    packet.session_id = "s";
    packet.file_name = "a.bin";
    packet.key_id = "k";
    packet.wrapped_key = Bytes{1};
    packet.nonce = Bytes(12, 0);
    packet.auth_tag = Bytes(16, 0);
    const auto valid = protocol::encode_upload(packet, "key");

    for (const char* header : {protocol::kHeaderChunkIndex, protocol::kHeaderFileName,
                               protocol::kHeaderSessionId, protocol::kHeaderKeyId,
                               protocol::kHeaderWrappedKey, protocol::kHeaderNonce,
                               protocol::kHeaderAuthTag}) {
        auto request = valid;
        request.headers.erase(header);
        auto decoded = protocol::decode_upload(request);
        ASSERT_TRUE(decoded.is_error()) << header;
        EXPECT_EQ(decoded.error().code, ErrorCode::PayloadRejected);
        EXPECT_NE(decoded.error().message.find(header), std::string::npos);
    }

    auto bad_index = valid;
    bad_index.set_header(protocol::kHeaderChunkIndex, "-1");
    EXPECT_TRUE(protocol::decode_upload(bad_index).is_error());

    auto bad_nonce = valid;
    bad_nonce.set_header(protocol::kHeaderNonce, "zz");
    EXPECT_TRUE(protocol::decode_upload(bad_nonce).is_error());

    auto bad_key = valid;
    bad_key.set_header(protocol::kHeaderWrappedKey, "!!!");
    EXPECT_TRUE(protocol::decode_upload(bad_key).is_error());
}

TEST(UploadProtocolTest, BearerTokenRequiresScheme) {
    auto request = make_request(HttpMethod::GET, "/upload/status");
    EXPECT_FALSE(protocol::bearer_token(request).has_value());
    request.set_header("authorization", "Basic abc");
    EXPECT_FALSE(protocol::bearer_token(request).has_value());
    request.set_header("authorization", "Bearer abc");
    EXPECT_EQ(protocol::bearer_token(request).value(), "abc");
}

TEST(UploadProtocolTest, AckAndFinalizedBodies) {
    ixcp::transfer::ChunkAck ack;
    ack.file_key = "a.bin";
    ack.client_file_name = "dir/a.bin";
    ack.chunk_index = 5;
    ack.already_received = true;

    const json body = protocol::ack_to_json(ack);
    EXPECT_EQ(body["message"], protocol::kMessageDuplicate);
    EXPECT_EQ(body["actualFilename"], "a.bin");

    auto parsed = protocol::ack_from_json(body);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().chunk_index, 5u);
    EXPECT_TRUE(parsed.value().already_received);
    EXPECT_EQ(parsed.value().client_file_name, "dir/a.bin");

    auto no_index = protocol::ack_from_json(json{{"message", "ok"}});
    ASSERT_TRUE(no_index.is_error());
    EXPECT_EQ(no_index.error().code, ErrorCode::ProtocolError);

    auto file = protocol::finalized_from_json(
        protocol::finalized_to_json({"a.bin", 3, 2500, "deadbeef"}));
    ASSERT_TRUE(file.is_ok());
    EXPECT_EQ(file.value().chunk_count, 3u);
    EXPECT_EQ(file.value().total_bytes, 2500u);
    EXPECT_EQ(file.value().sha256, "deadbeef");

    EXPECT_TRUE(protocol::finalized_from_json(json{{"filename", 1}, {"chunkCount", 3}}).is_error());
    EXPECT_TRUE(protocol::finalized_from_json(json::array()).is_error());
}

TEST(UploadProtocolTest, ErrorMessageFallsBackToText) {
    EXPECT_EQ(protocol::error_message(protocol::error_response(HttpStatus::CONFLICT, "missing 2")),
              "missing 2");

    HttpResponse plain(HttpStatus::SERVICE_UNAVAILABLE);
    plain.set_body("upstream down");
    EXPECT_EQ(protocol::error_message(plain), "upstream down");

    HttpResponse empty(HttpStatus::SERVICE_UNAVAILABLE);
    EXPECT_EQ(protocol::error_message(empty), "503 Service Unavailable");
}
