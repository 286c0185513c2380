#include <gtest/gtest.h>

#include <new>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "exit_codes.hpp"

using namespace refrax;

namespace {

template <class E>
std::exception_ptr thrown(const E& e)
{
    return std::make_exception_ptr(e);
}

}  // namespace

TEST(ExitCodes, CommandFailuresMapToTheirStatus)
{
    EXPECT_EQ(report_command_failure(thrown(BackboneLoadError("weights"))), kExitFatal);
    EXPECT_EQ(report_command_failure(thrown(StorageUnavailableError("models"))), kExitFatal);
    EXPECT_EQ(report_command_failure(thrown(TrainingAbortedError("cancelled"))), kExitCancelled);
    EXPECT_EQ(report_command_failure(thrown(NoModelLoadedError("none"))), kExitFailure);
    EXPECT_EQ(report_command_failure(thrown(std::invalid_argument("stod"))), kExitUsage);
}

TEST(ExitCodes, UnexpectedStdExceptionIsAFailureNotACrash)
{
    EXPECT_EQ(report_command_failure(thrown(std::runtime_error("filesystem error"))), kExitFailure);
    EXPECT_EQ(report_command_failure(thrown(std::bad_alloc())), kExitFailure);
}

TEST(ExitCodes, ConfigurationFailuresAreUsageErrors)
{
    EXPECT_EQ(report_config_failure(thrown(InvalidRangeError("step"))), kExitUsage);
    try {
        (void)nlohmann::json::parse("{broken");
        FAIL() << "parse should have thrown";
    } catch (const nlohmann::json::exception&) {
        EXPECT_EQ(report_config_failure(std::current_exception()), kExitUsage);
    }
    EXPECT_EQ(report_config_failure(thrown(std::runtime_error("io"))), kExitUsage);
}

TEST(ExitCodes, ForeignExceptionsAreRethrown)
{
    EXPECT_THROW(report_command_failure(std::make_exception_ptr(42)), int);
}
