#define BOOST_TEST_MODULE s3batch

#include <boost/test/unit_test.hpp>

#include <aws/core/Aws.h>

// The engine code uses the SDK's memory and logging facilities; initialize them once per run
struct AwsSdkFixture {
    AwsSdkFixture() {
        options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
        Aws::InitAPI(options_);
    }

    ~AwsSdkFixture() {
        Aws::ShutdownAPI(options_);
    }

    Aws::SDKOptions options_;
};

BOOST_TEST_GLOBAL_FIXTURE(AwsSdkFixture);
