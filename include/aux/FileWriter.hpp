#ifndef FILEWRITER_HPP
#define FILEWRITER_HPP

#include <string>
#include <fstream>

#include "core/Segment.hpp"

// Sequential binary writer for a segment file or the merged artifact
class FileWriter
{
public:
    FileWriter(const std::string &filePath, bool isAppendMode);
    ~FileWriter();

    bool isOpen() const;
    bool write(const char *data, size_t size);
    bool flush();
    bool close();

    const std::string &getPath() const { return _path; }
    ByteOffset getBytesWritten() const { return _bytesWritten; }

private:
    std::string _path;
    std::ofstream _out;
    ByteOffset _bytesWritten{0};
};

#endif
