// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_UTILS_WORKER_PACK_H
#define REMORA_SRC_UTILS_WORKER_PACK_H

#include <functional>
#include <memory>

/**
 * @brief A set of worker threads pulling task indices `0..n_tasks-1` from a shared counter.
 *
 * Each worker calls `work(worker_index, task_index)`. When a task throws, the exception is
 * kept in the worker's slot, no new tasks are handed out, and join() rethrows the exception
 * of the lowest failing task index once all threads have stopped. The result of a run is
 * therefore independent of scheduling as long as tasks write only into per-task storage.
 */
class WorkerPack {
public:
    virtual ~WorkerPack() = default;
    virtual void join() = 0;
    [[nodiscard]] virtual bool has_exception() const = 0;

    static std::unique_ptr<WorkerPack> launch(int n_workers, int n_tasks,
                                              std::function<void(int worker, int task)> work);
};

/// Launch a pack and wait for it; rethrows the first failing task's exception.
void run_workers(int n_workers, int n_tasks, std::function<void(int worker, int task)> work);

/// Resolve a requested thread count: 0 means hardware concurrency; never more than @p n_tasks, never less than 1.
int resolve_worker_count(int requested, int n_tasks);

#endif //REMORA_SRC_UTILS_WORKER_PACK_H
