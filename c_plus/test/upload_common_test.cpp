#include <boost/test/unit_test.hpp>

#include "common/UploadCommon.h"
#include "test_helpers.h"

using namespace s3batch_test;

BOOST_AUTO_TEST_SUITE(upload_common)

BOOST_AUTO_TEST_CASE(test_forward_transitions_are_allowed) {
    BOOST_REQUIRE(isValidTransition(TRANSFER_QUEUED, TRANSFER_IN_PROGRESS));
    BOOST_REQUIRE(isValidTransition(TRANSFER_IN_PROGRESS, TRANSFER_RETRYING));
    BOOST_REQUIRE(isValidTransition(TRANSFER_RETRYING, TRANSFER_IN_PROGRESS));
    BOOST_REQUIRE(isValidTransition(TRANSFER_IN_PROGRESS, TRANSFER_SUCCEEDED));
    BOOST_REQUIRE(isValidTransition(TRANSFER_IN_PROGRESS, TRANSFER_FAILED));
    BOOST_REQUIRE(isValidTransition(TRANSFER_QUEUED, TRANSFER_CANCELLED));
    BOOST_REQUIRE(isValidTransition(TRANSFER_IN_PROGRESS, TRANSFER_CANCELLED));
    BOOST_REQUIRE(isValidTransition(TRANSFER_RETRYING, TRANSFER_CANCELLED));
}

BOOST_AUTO_TEST_CASE(test_skipping_states_is_rejected) {
    BOOST_REQUIRE(!isValidTransition(TRANSFER_QUEUED, TRANSFER_SUCCEEDED));
    BOOST_REQUIRE(!isValidTransition(TRANSFER_QUEUED, TRANSFER_RETRYING));
    BOOST_REQUIRE(!isValidTransition(TRANSFER_RETRYING, TRANSFER_SUCCEEDED));
    BOOST_REQUIRE(!isValidTransition(TRANSFER_RETRYING, TRANSFER_FAILED));
    BOOST_REQUIRE(!isValidTransition(TRANSFER_IN_PROGRESS, TRANSFER_QUEUED));
}

BOOST_AUTO_TEST_CASE(test_terminal_states_are_absorbing) {
    const TransferState terminal[] = {TRANSFER_SUCCEEDED, TRANSFER_FAILED, TRANSFER_CANCELLED};
    const TransferState all[] = {TRANSFER_QUEUED, TRANSFER_IN_PROGRESS, TRANSFER_RETRYING,
                                 TRANSFER_SUCCEEDED, TRANSFER_FAILED, TRANSFER_CANCELLED};
    for (TransferState from : terminal) {
        BOOST_REQUIRE(isTerminalState(from));
        for (TransferState to : all) {
            BOOST_REQUIRE_MESSAGE(!isValidTransition(from, to),
                                  transferStateName(from) << " -> " << transferStateName(to));
        }
    }
    BOOST_REQUIRE(!isTerminalState(TRANSFER_QUEUED));
    BOOST_REQUIRE(!isTerminalState(TRANSFER_RETRYING));
}

BOOST_AUTO_TEST_CASE(test_make_transfer_task_stats_file) {
    TempFile file("hello world");
    TransferTask task = makeTransferTask(file.path(), "bucket", "");

    BOOST_REQUIRE_EQUAL(task.sizeBytes, 11);
    BOOST_REQUIRE_EQUAL(task.bucketName, "bucket");
    // Key defaults to the file name
    BOOST_REQUIRE_EQUAL(task.objectKey, extractFileName(file.path()));
    BOOST_REQUIRE(task.id.empty());
}

BOOST_AUTO_TEST_CASE(test_make_transfer_task_missing_file) {
    TransferTask task = makeTransferTask("/nonexistent/dir/data.bin", "bucket", "raw/data.bin");
    BOOST_REQUIRE_EQUAL(task.sizeBytes, 0);
    BOOST_REQUIRE_EQUAL(task.objectKey, "raw/data.bin");
    BOOST_REQUIRE(!fileExists("/nonexistent/dir/data.bin"));
    BOOST_REQUIRE_EQUAL(getLocalFileSize("/nonexistent/dir/data.bin"), -1);
}

BOOST_AUTO_TEST_CASE(test_extract_file_name) {
    BOOST_REQUIRE_EQUAL(extractFileName("a/b/c.edf"), "c.edf");
    BOOST_REQUIRE_EQUAL(extractFileName("C:\\data\\c.edf"), "c.edf");
    BOOST_REQUIRE_EQUAL(extractFileName("c.edf"), "c.edf");
    BOOST_REQUIRE_EQUAL(extractFileName("folder/"), "");
}

BOOST_AUTO_TEST_CASE(test_status_json_carries_error_only_when_present) {
    TransferStatus status;
    status.state = TRANSFER_SUCCEEDED;
    status.attempts = 2;
    status.totalSize = 42;

    nlohmann::json ok = statusToJson("t_1", status);
    BOOST_REQUIRE_EQUAL(ok["taskId"].get<std::string>(), "t_1");
    BOOST_REQUIRE_EQUAL(ok["state"].get<std::string>(), "Succeeded");
    BOOST_REQUIRE_EQUAL(ok["status"].get<int>(), 3);
    BOOST_REQUIRE_EQUAL(ok["attempts"].get<int>(), 2);
    BOOST_REQUIRE_EQUAL(ok["totalSize"].get<long long>(), 42);
    BOOST_REQUIRE(!ok.contains("errorKind"));

    status.state = TRANSFER_FAILED;
    status.hasError = true;
    status.lastError = StoreError(STORE_ACCESS_DENIED, "denied", 403);
    nlohmann::json failed = statusToJson("t_2", status);
    BOOST_REQUIRE_EQUAL(failed["errorKind"].get<std::string>(), "AccessDenied");
    BOOST_REQUIRE_EQUAL(failed["errorMessage"].get<std::string>(), "denied");
    BOOST_REQUIRE_EQUAL(failed["httpStatusCode"].get<int>(), 403);

    StatusSnapshot snapshot;
    snapshot["t_1"] = TransferStatus();
    snapshot["t_2"] = status;
    nlohmann::json rendered = snapshotToJson(snapshot);
    BOOST_REQUIRE(rendered.is_array());
    BOOST_REQUIRE_EQUAL(rendered.size(), 2u);
}

BOOST_AUTO_TEST_CASE(test_task_ids_are_unique_per_sequence) {
    BOOST_REQUIRE_EQUAL(getTaskId("1700000000", 7), "1700000000_7");
    BOOST_REQUIRE_NE(getTaskId("tag", 1), getTaskId("tag", 2));
}

BOOST_AUTO_TEST_CASE(test_create_response) {
    nlohmann::json response = nlohmann::json::parse(create_response(2, formatErrorMessage("Queue full", "100 queued")));
    BOOST_REQUIRE_EQUAL(response["code"].get<int>(), 2);
    BOOST_REQUIRE_EQUAL(response["message"].get<std::string>(), "Queue full: 100 queued");
}

BOOST_AUTO_TEST_SUITE_END()
