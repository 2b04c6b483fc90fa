#ifndef TRANSFERWORKER_HPP
#define TRANSFERWORKER_HPP

#include <string>

#include "core/Segment.hpp"
#include "core/ProgressLedger.hpp"
#include "util/HttpClient.hpp"
#include "aux/CancellationToken.hpp"

// Fetches one segment's range into its segment file and reports into the ledger.
// Failures never escape as exceptions; they come back as an INCOMPLETE result.
class TransferWorker
{
public:
    TransferWorker(HttpClient &client,
                   ProgressLedger &ledger,
                   const CancellationToken &cancel,
                   const std::string &url,
                   const std::string &segmentFilePath,
                   ByteOffset totalSize,
                   bool appendToSegmentFile);

    // attemptOffset is the absolute position this attempt starts from (0 on a fresh download)
    SegmentResult run(const Segment &segment, ByteOffset rangeStart, ByteOffset rangeEnd, ByteOffset attemptOffset);

    // Bytes the server can deliver for [rangeStart, rangeEnd] of a totalSize resource
    static ByteOffset expectedBytes(ByteOffset rangeStart, ByteOffset rangeEnd, ByteOffset totalSize);

private:
    HttpClient &_client;
    ProgressLedger &_ledger;
    const CancellationToken &_cancel;
    std::string _url;
    std::string _segmentFilePath;
    ByteOffset _totalSize;
    bool _appendToSegmentFile;

    SegmentResult finish(int segmentId, SegmentState state, const std::string &reason);
};

#endif
