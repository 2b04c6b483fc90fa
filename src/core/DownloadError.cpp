#include "core/DownloadError.hpp"

DownloadError::DownloadError(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), _kind(kind)
{
}

const char *errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::INVALID_CONFIGURATION:
        return "invalid configuration";
    case ErrorKind::NETWORK:
        return "network error";
    case ErrorKind::PERSISTENCE:
        return "persistence error";
    case ErrorKind::MERGE:
        return "merge error";
    }

    return "error";
}
