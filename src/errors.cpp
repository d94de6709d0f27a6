#include "errors.hpp"

namespace p2ps {

std::string errorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:               return "OK";
        case ErrorCode::BIND_ERROR:       return "BIND_ERROR";
        case ErrorCode::CONNECT_ERROR:    return "CONNECT_ERROR";
        case ErrorCode::PROTOCOL_ERROR:   return "PROTOCOL_ERROR";
        case ErrorCode::NOT_FOUND_ERROR:  return "NOT_FOUND_ERROR";
        case ErrorCode::SHORT_READ_ERROR: return "SHORT_READ_ERROR";
        case ErrorCode::REMOTE_ERROR:     return "REMOTE_ERROR";
        case ErrorCode::IO_ERROR:         return "IO_ERROR";
        case ErrorCode::NOT_CONNECTED:    return "NOT_CONNECTED";
        case ErrorCode::INVALID_NAME:     return "INVALID_NAME";
    }

    return "UNKNOWN";
}

} //p2ps
