/*───────────────────────────────────────────────────────────
 *  errors.hpp   –  typed failures raised by the refrax core
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace refrax {

struct RefraxError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/* bad numeric range: step <= 0, empty interval, out-of-domain sweep, bad option */
struct InvalidRangeError : RefraxError {
    using RefraxError::RefraxError;
};

/* too few raw samples, too narrow an angular span, unreadable raw file */
struct InsufficientDataError : RefraxError {
    using RefraxError::RefraxError;
};

/* non-numeric line in a raw data file (strict mode) or a corrupt raster */
struct DataFormatError : RefraxError {
    DataFormatError(const std::string& msg, std::size_t line = 0)
        : RefraxError(line ? msg + " (line " + std::to_string(line) + ")" : msg),
          line_(line) {}
    std::size_t line() const { return line_; }
private:
    std::size_t line_;
};

/* frozen backbone weights missing or inconsistent – fatal */
struct BackboneLoadError : RefraxError {
    using RefraxError::RefraxError;
};

/* no cluster reaches the minimum sample count */
struct InsufficientValidSamplesError : RefraxError {
    using RefraxError::RefraxError;
};

/* optimization cancelled before any trial succeeded, or timed out before the first one ran */
struct TrainingAbortedError : RefraxError {
    using RefraxError::RefraxError;
};

/* every trial of an optimization run failed */
struct NoValidConfigurationError : RefraxError {
    using RefraxError::RefraxError;
};

/* prediction requested without a trained model */
struct NoModelLoadedError : RefraxError {
    using RefraxError::RefraxError;
};

/* required directory missing or not writable */
struct StorageUnavailableError : RefraxError {
    using RefraxError::RefraxError;
};

/* artifact unreadable, wrong version or incompatible with the backbone */
struct ModelFormatError : RefraxError {
    using RefraxError::RefraxError;
};

}  // namespace refrax
