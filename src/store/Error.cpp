#include "store/Error.hpp"

#include <fmt/core.h>

using namespace mfsync::store;

Error::Error(std::string op, std::string path, const std::string& message, const long httpStatus, const int code)
    : std::runtime_error(fmt::format("{} {}: {}", op, path, message)),
      op_(std::move(op)),
      path_(std::move(path)),
      message_(message),
      httpStatus_(httpStatus),
      code_(code) {}

bool Error::isNotFound() const {
    return message_.find("does not exist") != std::string::npos ||
           message_.find("not found") != std::string::npos;
}
