#include "aux/FileWriter.hpp"

FileWriter::FileWriter(const std::string &fp, bool isAppendMode)
    : _path(fp)
{
    std::ios::openmode mode = std::ios::binary; // Open file in binary mode
    if (isAppendMode)
    {
        mode |= std::ios::app; // Append bytes to end of file
    }
    else
    {
        mode |= std::ios::trunc; // Overwrite existing file
    }

    _out.open(fp, mode); // Open file for writing
}

FileWriter::~FileWriter()
{
    // Close file in destructor if still open
    if (_out.is_open())
    {
        _out.close();
    }
}

bool FileWriter::isOpen() const
{
    return _out.is_open();
}

// Returns false once the stream has failed; nothing is counted for a failed write
bool FileWriter::write(const char *data, size_t size)
{
    if (!_out.is_open() || !_out)
    {
        return false;
    }

    _out.write(data, static_cast<std::streamsize>(size));
    if (!_out)
    {
        return false;
    }

    _bytesWritten += static_cast<ByteOffset>(size);
    return true;
}

// Pushes buffered bytes to the file; false if any of them could not be stored
bool FileWriter::flush()
{
    if (!_out.is_open() || !_out)
    {
        return false;
    }

    _out.flush();
    return static_cast<bool>(_out);
}

// Flushes and closes, reporting whether every byte reached the file
bool FileWriter::close()
{
    if (!_out.is_open())
    {
        return true;
    }

    _out.flush();
    bool good = static_cast<bool>(_out);
    _out.close();
    return good && !_out.fail();
}
