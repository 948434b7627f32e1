#include "types/Error.hpp"

namespace ms::types {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedPlatform: return "UnsupportedPlatform";
        case ErrorKind::DownloadFailed: return "DownloadFailed";
        case ErrorKind::ProbeError: return "ProbeError";
        case ErrorKind::FetchFailed: return "FetchFailed";
        case ErrorKind::NotFound: return "NotFound";
    }
    return "Unknown";
}

}
