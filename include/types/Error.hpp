#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace ms::types {

enum class ErrorKind {
    UnsupportedPlatform,   // no download entry for the host
    DownloadFailed,        // network, HTTP or disk failure while provisioning
    ProbeError,            // timeout, non-zero exit or malformed output
    FetchFailed,           // could not obtain even partial bytes
    NotFound               // file key unresolvable
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
bool ok(const Result<T>& r) { return std::holds_alternative<T>(r); }

// What the pipeline does with a failed stage.
enum class Disposition { Fallback, Surface };

constexpr Disposition dispositionFor(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedPlatform:
        case ErrorKind::DownloadFailed:
        case ErrorKind::ProbeError:
        case ErrorKind::FetchFailed:
            return Disposition::Fallback;
        case ErrorKind::NotFound:
            return Disposition::Surface;
    }
    return Disposition::Surface;
}

std::string_view to_string(ErrorKind kind);

}
