/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file writes.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace scratchpad::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation and the promise completed when it lands.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::promise<void> done;
};

/**
 * @class PersistenceService
 * @brief Owns a background thread that performs atomic file writes sequentially.
 *
 * Every write goes through a single queue, so two writers can never interleave
 * on the same file inside this process.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues @p content to be written to @p filename.
     * @return Future that becomes ready once the rename completed, or carries
     *         a ScratchpadError(IOError) if the write failed.
     */
    std::future<void> saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Queues the write and blocks until it completed. Rethrows write failures. */
    void saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Stops the worker thread after all pending tasks are processed.
     */
    void stop();

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename). Throws on failure.
     */
    void performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace scratchpad::infrastructure
