#include <boost/test/unit_test.hpp>

#include "common/RetryPolicy.h"
#include "common/request/s3_client_manager.h"
#include "common/request/s3_object_store_client.h"

BOOST_AUTO_TEST_SUITE(s3_error_mapping)

BOOST_AUTO_TEST_CASE(test_http_status_codes) {
    BOOST_REQUIRE_EQUAL(classifyS3Failure(401, "", "unauthorized", false).kind, STORE_AUTHENTICATION_FAILED);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(403, "", "forbidden", false).kind, STORE_ACCESS_DENIED);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(404, "", "missing", false).kind, STORE_NOT_FOUND);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(400, "", "bad", false).kind, STORE_INVALID_REQUEST);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(408, "", "slow", false).kind, STORE_TIMEOUT);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(429, "", "busy", false).kind, STORE_THROTTLED);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(500, "", "oops", false).kind, STORE_SERVER_ERROR);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(502, "", "gateway", false).kind, STORE_SERVER_ERROR);
}

BOOST_AUTO_TEST_CASE(test_exception_names_take_precedence) {
    // S3 reports throttling as 503 SlowDown
    BOOST_REQUIRE_EQUAL(classifyS3Failure(503, "SlowDown", "reduce rate", false).kind, STORE_THROTTLED);
    // Signature problems come back as 403 but are authentication failures
    BOOST_REQUIRE_EQUAL(classifyS3Failure(403, "SignatureDoesNotMatch", "sig", false).kind,
                        STORE_AUTHENTICATION_FAILED);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(400, "ExpiredToken", "expired", false).kind,
                        STORE_AUTHENTICATION_FAILED);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(400, "RequestTimeout", "idle", false).kind, STORE_TIMEOUT);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(0, "NoSuchBucket", "gone", false).kind, STORE_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(test_network_failures) {
    StoreError reset = classifyS3Failure(-1, "", "Connection reset by peer", true);
    BOOST_REQUIRE_EQUAL(reset.kind, STORE_CONNECTION_RESET);
    BOOST_REQUIRE_EQUAL(reset.httpStatusCode, 0);

    BOOST_REQUIRE_EQUAL(classifyS3Failure(0, "", "Operation timed out", true).kind, STORE_TIMEOUT);
    BOOST_REQUIRE_EQUAL(classifyS3Failure(-1, "", "curlCode: 28, Timeout was reached", false).kind, STORE_TIMEOUT);
}

BOOST_AUTO_TEST_CASE(test_unmapped_status_is_unknown) {
    StoreError error = classifyS3Failure(409, "OperationAborted", "conflict", false);
    BOOST_REQUIRE_EQUAL(error.kind, STORE_UNKNOWN);
    BOOST_REQUIRE_EQUAL(error.httpStatusCode, 409);
    BOOST_REQUIRE_EQUAL(error.message, "conflict");
}

BOOST_AUTO_TEST_CASE(test_mapped_kinds_feed_retry_classification) {
    BOOST_REQUIRE_EQUAL(RetryPolicy::classify(classifyS3Failure(503, "SlowDown", "", false)), ERROR_TRANSIENT);
    BOOST_REQUIRE_EQUAL(RetryPolicy::classify(classifyS3Failure(403, "AccessDenied", "", false)), ERROR_PERMANENT);
    BOOST_REQUIRE_EQUAL(RetryPolicy::classify(classifyS3Failure(-1, "", "reset", true)), ERROR_TRANSIENT);
}

BOOST_AUTO_TEST_CASE(test_expired_credential_detection) {
    BOOST_REQUIRE(isExpiredCredentialError("ExpiredToken", "The provided token has expired."));
    BOOST_REQUIRE(!isExpiredCredentialError("NoSuchBucket", "The specified bucket does not exist"));
}

BOOST_AUTO_TEST_CASE(test_credential_parsing) {
    nlohmann::json input = {
        {"accessKeyId", "AKIAEXAMPLE"},
        {"secretAccessKey", "secret"},
        {"sessionToken", "token"},
        {"expirationTimestampSecondsInUTC", "1893456000"}
    };
    S3Credential credential = S3Credential::from_json(input);
    BOOST_REQUIRE_EQUAL(credential.accessKeyId, "AKIAEXAMPLE");
    BOOST_REQUIRE_EQUAL(credential.sessionToken, "token");
    BOOST_REQUIRE(credential.expires());
    BOOST_REQUIRE_EQUAL(static_cast<long long>(credential.expiration), 1893456000LL);

    S3Credential permanent = S3Credential::from_json({{"accessKeyId", "a"}, {"secretAccessKey", "b"}});
    BOOST_REQUIRE(!permanent.expires());

    BOOST_REQUIRE_THROW(S3Credential::from_json({{"accessKeyId", "a"}}), std::runtime_error);
    BOOST_REQUIRE_THROW(S3Credential::from_json({{"accessKeyId", "a"}, {"secretAccessKey", "b"},
                                                 {"expirationTimestampSecondsInUTC", "soon"}}),
                        std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
