//
// Created by cv2 on 08.10.2026.
//

#include "upload_transport.hpp"

namespace perch {

const char* kind_name(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::Transport: return "HTTP error";
        case TransportError::Kind::Decode: return "JSON error";
        case TransportError::Kind::FileIo: return "IO error";
        case TransportError::Kind::Service: return "API returned error";
    }
    return "unknown error";
}

std::string describe(const TransportError& e) {
    return std::string(kind_name(e.kind)) + ": " + e.message;
}

} // namespace perch
