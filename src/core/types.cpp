#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:                return "none";
    case ErrorKind::PortUnreachable:     return "port unreachable";
    case ErrorKind::AuthFailed:          return "authentication failed";
    case ErrorKind::Timeout:             return "timeout";
    case ErrorKind::PathNotFound:        return "path not found";
    case ErrorKind::ProtocolUnavailable: return "protocol unavailable";
    case ErrorKind::NonZeroExit:         return "non-zero exit";
    case ErrorKind::RebootTimeout:       return "reboot timeout";
    case ErrorKind::ConfigMissing:       return "configuration missing";
    case ErrorKind::ChannelFailed:       return "channel failed";
    case ErrorKind::Io:                  return "i/o error";
    case ErrorKind::Cancelled:           return "cancelled";
    }
    return "unknown";
}
