#include "aux/WorkerGroup.hpp"

// Joins anything still running so no worker outlives the state it references
WorkerGroup::~WorkerGroup()
{
    joinAll();
}

void WorkerGroup::spawn(std::function<void()> job)
{
    _workers.emplace_back(std::move(job));
}

// Blocks until every spawned job has returned
void WorkerGroup::joinAll()
{
    for (auto &worker : _workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

size_t WorkerGroup::size() const
{
    return _workers.size();
}
