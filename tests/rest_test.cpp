#include "../src/rest.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace firestore_cpp;
using namespace firestore_cpp::detail;

namespace {

auto server_error(long status, const std::string& code, const std::string& message) -> HttpResponse {
    return HttpResponse{status, R"({"error": {"code": )" + std::to_string(status) +
                                    R"(, "message": ")" + message +
                                    R"(", "status": ")" + code + R"("}})"};
}

}  // namespace

// =============================================================================
// Document endpoint errors
// =============================================================================

TEST(DocumentError, not_found) {
    auto e = document_error(server_error(404, "NOT_FOUND", "Document not found"));
    EXPECT_EQ(e.kind, ErrorKind::not_found);
    EXPECT_EQ(e.message, "Document not found");
}

TEST(DocumentError, precondition_and_existence_are_conflicts) {
    EXPECT_EQ(document_error(server_error(400, "FAILED_PRECONDITION", "stale")).kind, ErrorKind::conflict);
    EXPECT_EQ(document_error(server_error(409, "ABORTED", "contention")).kind, ErrorKind::conflict);
    EXPECT_EQ(document_error(server_error(409, "ALREADY_EXISTS", "exists")).kind, ErrorKind::conflict);
}

TEST(DocumentError, limits_are_quota_exceeded) {
    EXPECT_EQ(document_error(server_error(429, "RESOURCE_EXHAUSTED", "slow down")).kind,
              ErrorKind::quota_exceeded);
    EXPECT_EQ(document_error(server_error(400, "INVALID_ARGUMENT",
                                          "too many index entries for entity")).kind,
              ErrorKind::quota_exceeded);
    EXPECT_EQ(document_error(HttpResponse{413, "Request Entity Too Large"}).kind,
              ErrorKind::quota_exceeded);
}

TEST(DocumentError, unauthenticated) {
    EXPECT_EQ(document_error(server_error(401, "UNAUTHENTICATED", "expired")).kind,
              ErrorKind::authentication);
}

TEST(DocumentError, anything_else_is_transport_with_status) {
    auto e = document_error(server_error(400, "INVALID_ARGUMENT", "bad field name"));
    EXPECT_EQ(e.kind, ErrorKind::transport);
    EXPECT_EQ(e.message, "HTTP 400: bad field name");

    auto raw = document_error(HttpResponse{502, "Bad Gateway"});
    EXPECT_EQ(raw.kind, ErrorKind::transport);
    EXPECT_EQ(raw.message, "HTTP 502: Bad Gateway");
}

// =============================================================================
// Identity endpoint errors
// =============================================================================

TEST(IdentityError, client_errors_are_authentication) {
    auto e = identity_error(server_error(400, "INVALID_ARGUMENT", "INVALID_PASSWORD"));
    EXPECT_EQ(e.kind, ErrorKind::authentication);
    EXPECT_EQ(e.message, "INVALID_PASSWORD");
}

TEST(IdentityError, server_errors_are_transport) {
    auto e = identity_error(HttpResponse{500, "internal"});
    EXPECT_EQ(e.kind, ErrorKind::transport);
    EXPECT_EQ(e.message, "HTTP 500: internal");
}

// =============================================================================
// Bodies
// =============================================================================

TEST(ParseBody, empty_body_is_empty_object) {
    auto j = parse_body(HttpResponse{200, ""});
    ASSERT_TRUE(j);
    EXPECT_TRUE(j->is_object());
    EXPECT_TRUE(j->empty());
}

TEST(ParseBody, non_object_is_invalid_response) {
    for (const auto* body : {"[1, 2]", "not json", "\"text\""}) {
        auto j = parse_body(HttpResponse{200, body});
        ASSERT_FALSE(j) << body;
        EXPECT_EQ(j.error().kind, ErrorKind::invalid_response);
    }
}

TEST(DumpBody, invalid_utf8_is_unsupported) {
    auto r = dump_body(nlohmann::json{{"s", std::string{"\xff\xfe"}}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::unsupported_type);
}

TEST(DumpBody, serializes_objects) {
    auto r = dump_body(nlohmann::json{{"a", 1}});
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, R"({"a":1})");
}
