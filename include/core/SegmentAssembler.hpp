#ifndef SEGMENTASSEMBLER_HPP
#define SEGMENTASSEMBLER_HPP

#include <string>
#include <vector>

// Concatenates segment files into the final artifact.
// The artifact path only ever holds a fully merged file: output is built under
// "<artifact>.merge" and renamed into place, and the parts are removed afterwards.
class SegmentAssembler
{
public:
    explicit SegmentAssembler(const std::string &artifactPath);

    // partPaths must be in ascending segment order. Throws DownloadError(MERGE) on failure,
    // leaving every part file in place and no artifact behind.
    void assemble(const std::vector<std::string> &partPaths) const;

    std::string getTemporaryPath() const { return _artifactPath + ".merge"; }

private:
    std::string _artifactPath;

    void fail(const std::string &message) const;
};

#endif
