#ifndef WORKERGROUP_HPP
#define WORKERGROUP_HPP

#include <vector>
#include <thread>
#include <functional>

// One thread per spawned job; joinAll() is the barrier the coordinator waits on
class WorkerGroup
{
public:
    WorkerGroup() = default;
    ~WorkerGroup();

    WorkerGroup(const WorkerGroup &) = delete;
    WorkerGroup &operator=(const WorkerGroup &) = delete;

    void spawn(std::function<void()> job);
    void joinAll();
    size_t size() const;

private:
    std::vector<std::thread> _workers;
};

#endif
