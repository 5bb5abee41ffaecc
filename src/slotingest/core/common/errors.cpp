#include <slotingest/core/common/errors.h>

namespace slotingest {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LIST_FAILURE:
            return "LIST_FAILURE";
        case ErrorKind::FETCH_FAILURE:
            return "FETCH_FAILURE";
        case ErrorKind::DECODE_FAILURE:
            return "DECODE_FAILURE";
        case ErrorKind::PERMANENT_FAILURE:
            return "PERMANENT_FAILURE";
        case ErrorKind::CANCELLED:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

}  // namespace slotingest
