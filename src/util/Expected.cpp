#include "util/Expected.hpp"

namespace commitcheck {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::InvalidConfig: return "invalid-config";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::RefNotFound: return "ref-not-found";
        case ErrorCode::ObjectNotFound: return "object-not-found";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::UnsupportedObject: return "unsupported-object";
        case ErrorCode::InvalidMessage: return "invalid-message";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}
