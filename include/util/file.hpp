#ifndef FILE_HPP
#define FILE_HPP

#include <string>

#include "core/Segment.hpp"

bool fileExists(const std::string &path);
ByteOffset getFileSize(const std::string &path); // -1 if the file cannot be stat'ed
bool removeFile(const std::string &path);
bool renameFile(const std::string &from, const std::string &to);
bool ensureDirectory(const std::string &path);
std::string joinPath(const std::string &directory, const std::string &name);
std::string parentDirectory(const std::string &path);

#endif
