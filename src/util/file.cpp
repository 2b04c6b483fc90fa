#include <sys/stat.h>
#include <cerrno>
#include <cstdio>
#include <string>

#include "util/file.hpp"

// Checks if a file exists at the given path
bool fileExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0);
}

ByteOffset getFileSize(const std::string &path)
{
    struct stat buf{};
    if (stat(path.c_str(), &buf) != 0)
        return -1;

    return static_cast<ByteOffset>(buf.st_size);
}

bool removeFile(const std::string &path)
{
    return std::remove(path.c_str()) == 0;
}

// Replaces the destination if it exists (atomic on POSIX file systems)
bool renameFile(const std::string &from, const std::string &to)
{
    return std::rename(from.c_str(), to.c_str()) == 0;
}

// Creates the directory and any missing parents
bool ensureDirectory(const std::string &path)
{
    if (path.empty())
        return true;

    struct stat buf{};
    if (stat(path.c_str(), &buf) == 0)
        return S_ISDIR(buf.st_mode);

    std::string parent = parentDirectory(path);
    if (!parent.empty() && parent != path && !ensureDirectory(parent))
        return false;

    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

std::string joinPath(const std::string &directory, const std::string &name)
{
    if (directory.empty())
        return name;

    if (directory.back() == '/')
        return directory + name;

    return directory + "/" + name;
}

// Returns everything before the last '/', or an empty string for a bare file name
std::string parentDirectory(const std::string &path)
{
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return std::string();

    if (pos == 0)
        return "/";

    return path.substr(0, pos);
}
