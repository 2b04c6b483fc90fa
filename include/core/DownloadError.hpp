#ifndef DOWNLOADERROR_HPP
#define DOWNLOADERROR_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind
{
    INVALID_CONFIGURATION,
    NETWORK,
    PERSISTENCE,
    MERGE
};

// Raised for failures that end a download attempt (or, for PERSISTENCE, that the caller must report)
class DownloadError : public std::runtime_error
{
public:
    DownloadError(ErrorKind kind, const std::string &message);

    ErrorKind getKind() const { return _kind; }

private:
    ErrorKind _kind;
};

const char *errorKindToString(ErrorKind kind);

#endif
