#include "util/result.hpp"

#include <cassert>
#include <string>

std::string getErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCardFormat:
            return "InvalidCardFormat";
        case ErrorKind::UnknownEnumerationValue:
            return "UnknownEnumerationValue";
        case ErrorKind::SectionNotFound:
            return "SectionNotFound";
        case ErrorKind::MalformedHeader:
            return "MalformedHeader";
        case ErrorKind::MalformedStageLine:
            return "MalformedStageLine";
        case ErrorKind::HeroNotFound:
            return "HeroNotFound";
        case ErrorKind::InvalidState:
            return "InvalidState";
        case ErrorKind::FileNotFound:
            return "FileNotFound";
        default:
            assert(false);
            return "Unknown";
    }
}

std::string Error::describe() const {
    std::string description = getErrorKindName(kind);
    if (!stage.empty()) {
        description += " in stage " + stage;
    }
    if (fragmentIndex) {
        description += " at fragment " + std::to_string(*fragmentIndex);
    }
    description += ": " + message;
    return description;
}

Error makeError(ErrorKind kind, const std::string& message) {
    return Error{ .kind = kind, .message = message, .stage = "", .fragmentIndex = std::nullopt };
}

Error makeError(ErrorKind kind, const std::string& message, int fragmentIndex) {
    return Error{ .kind = kind, .message = message, .stage = "", .fragmentIndex = fragmentIndex };
}
