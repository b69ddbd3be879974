#include "menukit/utils/error.hpp"
#include <sstream>

namespace openflow::menukit {

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "]";

    if (!message_.empty()) {
        oss << " " << message_;
    }

    oss << " (at " << location_.file_name()
        << ":" << location_.line()
        << ":" << location_.column()
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
        case ErrorCode::CONFIG_WRITE_FAILED:
            return "CONFIG_WRITE_FAILED";

        // Host element errors
        case ErrorCode::ELEMENT_NOT_FOUND:
            return "ELEMENT_NOT_FOUND";
        case ErrorCode::ELEMENT_INVALID_BOUNDS:
            return "ELEMENT_INVALID_BOUNDS";

        case ErrorCode::LISTENER_NOT_FOUND:
            return "LISTENER_NOT_FOUND";

        // Graphics host errors
        case ErrorCode::GRAPHICS_INIT_FAILED:
            return "GRAPHICS_INIT_FAILED";

        // System errors
        case ErrorCode::SYSTEM_NOT_INITIALIZED:
            return "SYSTEM_NOT_INITIALIZED";
        case ErrorCode::SYSTEM_ALREADY_RUNNING:
            return "SYSTEM_ALREADY_RUNNING";

        // Generic errors
        case ErrorCode::INVALID_PARAMETER:
            return "INVALID_PARAMETER";
        case ErrorCode::OPERATION_FAILED:
            return "OPERATION_FAILED";
    }

    return "UNKNOWN_ERROR";
}

}  // namespace openflow::menukit
