#pragma once

#include <stdexcept>
#include <string>

namespace mfsync::store {

// Failure of one store call. `what()` reads "<op> <path>: <daemon message>".
class Error : public std::runtime_error {
public:
    Error(std::string op, std::string path, const std::string& message, long httpStatus = 0, int code = -1);

    [[nodiscard]] const std::string& op() const { return op_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] long httpStatus() const { return httpStatus_; }
    [[nodiscard]] int code() const { return code_; }

    [[nodiscard]] bool isNotFound() const;

private:
    std::string op_;
    std::string path_;
    std::string message_;
    long httpStatus_;
    int code_;
};

}
