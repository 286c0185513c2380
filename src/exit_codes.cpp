#include "exit_codes.hpp"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "errors.hpp"

namespace refrax {

int report_command_failure(std::exception_ptr ep)
{
    try {
        std::rethrow_exception(ep);
    } catch (const BackboneLoadError& e) {
        logE(std::string("fatal: ") + e.what());
        return kExitFatal;
    } catch (const StorageUnavailableError& e) {
        logE(std::string("fatal: ") + e.what());
        return kExitFatal;
    } catch (const TrainingAbortedError& e) {
        logW(e.what());
        return kExitCancelled;
    } catch (const RefraxError& e) {
        logE(e.what());
        return kExitFailure;
    } catch (const std::logic_error& e) {       // std::stod on a bad flag value
        logE(std::string("bad argument: ") + e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        logE(std::string("unexpected failure: ") + e.what());
        return kExitFailure;
    }
}

int report_config_failure(std::exception_ptr ep)
{
    try {
        std::rethrow_exception(ep);
    } catch (const nlohmann::json::exception& e) {
        logE(std::string("bad configuration value: ") + e.what());
    } catch (const std::exception& e) {
        logE(e.what());
    }
    return kExitUsage;
}

}  // namespace refrax
