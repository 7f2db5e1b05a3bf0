#pragma once
#include "bounded_queue.hpp"
#include "aggregator.hpp"
#include <string>
#include <vector>
#include <thread>
#include <cstddef>

// Ingestion workers: each pops raw event lines, parses them and hands the
// events to the aggregator. Lines that fail to parse count as parse errors.
// Destruction closes the queue, lets the workers drain it and joins them.
class WorkerPool {
public:
    WorkerPool(size_t n, BoundedQueue<std::string> &q, Aggregator &agg);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    void run();

    std::vector<std::thread> workers;
    BoundedQueue<std::string> &queue;
    Aggregator &aggregator;
};
