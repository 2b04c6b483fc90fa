#ifndef CANCELLATIONTOKEN_HPP
#define CANCELLATIONTOKEN_HPP

#include <atomic>

// Cooperative stop signal shared by the coordinator and every worker of an attempt.
// Workers poll it from their progress callback; nothing is interrupted preemptively.
class CancellationToken
{
public:
    void requestCancel() { _cancelled.store(true); }
    void reset() { _cancelled.store(false); }
    bool isCancelled() const { return _cancelled.load(); }

private:
    std::atomic<bool> _cancelled{false};
};

#endif
