/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "StdLib.hpp"

#include <algorithm>
#include <atomic>
#include <queue>

namespace Concurrency {
using namespace StdLib;

/** Fixed-size pool of worker threads consuming a FIFO task queue.
 *  Threads are started in the constructor and joined in the destructor.
 */
class WorkerPool {
public:
    using Task = Function<void()>;

    explicit WorkerPool(size_t threadCount) : mStop(false) {
        if (threadCount == 0) {
            threadCount = 1;
        }

        mWorkers.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            mWorkers.emplace_back([this]() { run(); });
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    virtual ~WorkerPool() {
        {
            LockGuard<Mutex> lock(mLock);
            mStop = true;
            mCondVar.notify_all();
        }

        for (auto& worker : mWorkers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t Size() const { return mWorkers.size(); }

    virtual void Submit(Task task) {
        {
            LockGuard<Mutex> lock(mLock);
            mTasks.push(std::move(task));
        }

        mCondVar.notify_one();
    }

    /** IsCurrentThreadWorker - Tells whether the caller runs on one of this pool's threads
     * @return True when called from inside a task of this pool
     */
    bool IsCurrentThreadWorker() const { return tCurrentPool == this; }

private:
    void run() {
        tCurrentPool = this;
        UniqueLock<Mutex> lock(mLock);
        while (true) {
            mCondVar.wait(lock, [this] { return mStop || !mTasks.empty(); });
            // Drain what is queued before leaving, a pending join may still wait on it
            if (mTasks.empty()) {
                break;
            }

            auto task = std::move(mTasks.front());
            mTasks.pop();
            lock.unlock();
            task();
            lock.lock();
        }
    }

    static inline thread_local const WorkerPool* tCurrentPool = nullptr;

    Vector<Thread> mWorkers;
    std::atomic<bool> mStop;
    std::queue<Task> mTasks;
    CondVar mCondVar;
    Mutex mLock;
};

/** Join barrier for a known number of tasks. The first exception reported through Done() is
 *  re-thrown by Wait() once every task has finished.
 */
class TaskGroup {
public:
    explicit TaskGroup(size_t taskCount) : mPending(taskCount) {}

    void Done(ExceptionPtr error = nullptr) {
        LockGuard<Mutex> lock(mLock);
        if (error && !mError) {
            mError = error;
        }

        if (--mPending == 0) {
            mCondVar.notify_all();
        }
    }

    /** Join - Blocks until every task has finished, errors stay captured */
    void Join() {
        UniqueLock<Mutex> lock(mLock);
        mCondVar.wait(lock, [this] { return mPending == 0; });
    }

    void Wait() {
        Join();
        LockGuard<Mutex> lock(mLock);
        if (mError) {
            std::rethrow_exception(mError);
        }
    }

private:
    size_t mPending;
    ExceptionPtr mError;
    CondVar mCondVar;
    Mutex mLock;
};

/** fParallelFor - Runs body(begin, end) over contiguous ranges of [0, count) on the pool and joins.
 *  Falls back to a single call on the current thread when no pool is given or when called from
 *  one of the pool's own workers.
 */
inline void fParallelFor(WorkerPool* pool, size_t count, size_t chunkCount, const Function<void(size_t, size_t)>& body) {
    if (count == 0) {
        return;
    }

    if (!pool || pool->IsCurrentThreadWorker() || chunkCount <= 1 || count == 1) {
        body(0, count);
        return;
    }

    chunkCount = std::min(chunkCount, count);
    const size_t chunkSize = (count + chunkCount - 1) / chunkCount;
    chunkCount = (count + chunkSize - 1) / chunkSize;
    TaskGroup group(chunkCount);
    size_t submitted = 0;
    try {
        for (; submitted < chunkCount; ++submitted) {
            const size_t begin = submitted * chunkSize;
            const size_t end = std::min(count, begin + chunkSize);
            pool->Submit([&body, &group, begin, end]() {
                try {
                    body(begin, end);
                    group.Done();
                }
                catch (...) {
                    group.Done(std::current_exception());
                }
            });
        }
    }
    catch (...) {
        // Queued tasks still reference body and group, they must finish before the error leaves this frame
        for (size_t chunk = submitted; chunk < chunkCount; ++chunk) {
            group.Done();
        }

        group.Join();
        throw;
    }

    group.Wait();
}
} // namespace Concurrency
