#include "quakemigrate/core/exception.hpp"

namespace quakemigrate {

Exception::Exception() : msg_("quakemigrate error") {}

Exception::Exception(const std::string& msg) : msg_(msg) {}

Exception::Exception(const char* msg) : msg_(msg) {}

const char* Exception::what() const noexcept { return msg_.c_str(); }

} // namespace quakemigrate
