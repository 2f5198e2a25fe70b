#include "metasplice/image_status.h"

namespace metasplice {

const char*
status_name(ImageStatus status) noexcept
{
    switch (status) {
    case ImageStatus::Ok: return "ok";
    case ImageStatus::WrongSignature: return "wrong_signature";
    case ImageStatus::BadCrc: return "bad_crc";
    case ImageStatus::Truncated: return "truncated";
    case ImageStatus::LimitExceeded: return "limit_exceeded";
    case ImageStatus::Unsupported: return "unsupported";
    case ImageStatus::Io: return "io";
    }
    return "unknown";
}

}  // namespace metasplice
