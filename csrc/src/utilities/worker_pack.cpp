// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "worker_pack.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace {

struct SharedState {
    std::mutex Mutex;
    std::atomic<int> NextTask{0};
    std::atomic<bool> Abort{false};
    std::vector<std::exception_ptr> Exceptions;
    std::vector<int> FailedTask;
};

class WorkerPackImpl : public WorkerPack {
public:
    WorkerPackImpl(std::vector<std::jthread> threads, std::shared_ptr<SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    // Abandoned packs stop handing out work; std::jthread joins on destruction.
    ~WorkerPackImpl() override {
        mState->Abort = true;
    }

    void join() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

    bool has_exception() const override {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (const auto& error : mState->Exceptions) {
            if (error) {
                return true;
            }
        }
        return false;
    }

private:
    void check_exceptions() {
        std::exception_ptr first;
        int first_task = -1;
        {
            std::lock_guard<std::mutex> lock(mState->Mutex);
            for (std::size_t t = 0; t < mState->Exceptions.size(); ++t) {
                if (auto error = mState->Exceptions[t]; error) {
                    if (!first || mState->FailedTask[t] < first_task) {
                        first = error;
                        first_task = mState->FailedTask[t];
                    }
                    mState->Exceptions[t] = nullptr;
                }
            }
        }
        if (first) {
            std::rethrow_exception(first);
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<SharedState> mState;
};

} // anonymous namespace

/**
 * @brief Launch worker threads and return a joinable pack (non-blocking).
 *
 * @param n_workers Number of threads; must be at least 1.
 * @param n_tasks Number of task indices to distribute.
 * @param work Callable invoked once per task with the executing worker's index.
 * @return Joinable pack that can be used to wait for completion.
 */
std::unique_ptr<WorkerPack> WorkerPack::launch(int n_workers, int n_tasks,
                                               std::function<void(int worker, int task)> work) {
    n_workers = std::max(n_workers, 1);
    auto shared_state = std::make_shared<SharedState>();
    shared_state->Exceptions.resize(n_workers);
    shared_state->FailedTask.resize(n_workers, -1);

    // the callable is shared between all threads and must outlive them
    auto shared_work = std::make_shared<std::function<void(int, int)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(n_workers);
    for (int worker = 0; worker < n_workers; ++worker) {
        threads.emplace_back([=]() {
            int task = -1;
            try {
                while (!shared_state->Abort) {
                    task = shared_state->NextTask.fetch_add(1);
                    if (task >= n_tasks) {
                        break;
                    }
                    (*shared_work)(worker, task);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[worker] = std::current_exception();
                shared_state->FailedTask[worker] = task;
                shared_state->Abort = true;
            }
        });
    }

    return std::make_unique<WorkerPackImpl>(std::move(threads), shared_state);
}

void run_workers(int n_workers, int n_tasks, std::function<void(int worker, int task)> work) {
    auto pack = WorkerPack::launch(n_workers, n_tasks, std::move(work));
    pack->join();
}

int resolve_worker_count(int requested, int n_tasks) {
    int n = requested;
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
    }
    return std::clamp(n, 1, std::max(n_tasks, 1));
}
