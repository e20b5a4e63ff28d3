#pragma once

#include <exception>
#include <string>

namespace quakemigrate {

/**
 * Exception - Base class for fatal errors raised by quakemigrate
 *
 * Data-quality problems never surface as exceptions; they are reported as
 * flags on the output records instead.
 */
class Exception : public std::exception {
public:
    Exception();
    explicit Exception(const std::string& msg);
    explicit Exception(const char* msg);

    const char* what() const noexcept override;

private:
    std::string msg_;
};

// Invalid or inconsistent run configuration, raised before processing starts
class ConfigError : public Exception {
public:
    using Exception::Exception;
};

// A requested allocation (grid, table or volume) exceeds the configured limit
class ResourceError : public Exception {
public:
    using Exception::Exception;
};

// Malformed input file
class FormatError : public Exception {
public:
    using Exception::Exception;
};

} // namespace quakemigrate
