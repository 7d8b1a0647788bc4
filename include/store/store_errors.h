#pragma once

#include <stdexcept>
#include <string>

namespace multiquery {

/// Failure of an index lookup or job submission. Propagated unmodified to
/// the caller of MultiIndexQuery::run(); no retries.
class StoreException : public std::runtime_error {
public:
    explicit StoreException(const std::string& msg) : std::runtime_error(msg) {}
};

/// Failure raised while a submitted job streams its results.
class JobException : public std::runtime_error {
public:
    explicit JobException(const std::string& msg) : std::runtime_error(msg) {}
};

/// The job exceeded its submission timeout.
class JobTimeoutException : public JobException {
public:
    explicit JobTimeoutException(const std::string& msg) : JobException(msg) {}
};

} // namespace multiquery
