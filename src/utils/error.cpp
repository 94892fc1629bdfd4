#include "flowdebug/utils/error.hpp"
#include <sstream>

namespace flowdebug {

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "]";

    if (!message_.empty()) {
        oss << " " << message_;
    }

    oss << " (at " << location_.file_name()
        << ":" << location_.line()
        << " in " << location_.function_name() << ")";

    return oss.str();
}

const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "SUCCESS";

        // Configuration errors
        case ErrorCode::CONFIG_INVALID_FORMAT:
            return "CONFIG_INVALID_FORMAT";
        case ErrorCode::CONFIG_INVALID_VALUE:
            return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:
            return "CONFIG_FILE_NOT_FOUND";

        // Breakpoint errors
        case ErrorCode::BREAKPOINT_INVALID:
            return "BREAKPOINT_INVALID";

        // Condition errors
        case ErrorCode::CONDITION_PARSE_ERROR:
            return "CONDITION_PARSE_ERROR";
        case ErrorCode::CONDITION_EVALUATION_ERROR:
            return "CONDITION_EVALUATION_ERROR";
        case ErrorCode::TYPE_MISMATCH:
            return "TYPE_MISMATCH";
        case ErrorCode::DIVISION_BY_ZERO:
            return "DIVISION_BY_ZERO";
        case ErrorCode::ARITHMETIC_OVERFLOW:
            return "ARITHMETIC_OVERFLOW";

        // Variable errors
        case ErrorCode::VARIABLE_NOT_FOUND:
            return "VARIABLE_NOT_FOUND";
        case ErrorCode::VARIABLE_INVALID_NAME:
            return "VARIABLE_INVALID_NAME";
        case ErrorCode::VARIABLE_INVALID_SCOPE:
            return "VARIABLE_INVALID_SCOPE";

        // I/O errors
        case ErrorCode::IO_READ_FAILED:
            return "IO_READ_FAILED";
        case ErrorCode::IO_WRITE_FAILED:
            return "IO_WRITE_FAILED";
        case ErrorCode::FILE_ERROR:
            return "FILE_ERROR";

        // Session / system errors
        case ErrorCode::SYSTEM_ALREADY_RUNNING:
            return "SYSTEM_ALREADY_RUNNING";
        case ErrorCode::FLOW_EMPTY:
            return "FLOW_EMPTY";
        case ErrorCode::STEP_FAILED:
            return "STEP_FAILED";

        // Generic errors
        case ErrorCode::INVALID_PARAMETER:
            return "INVALID_PARAMETER";
        case ErrorCode::OPERATION_FAILED:
            return "OPERATION_FAILED";
    }
    return "UNKNOWN_ERROR";
}

}  // namespace flowdebug
