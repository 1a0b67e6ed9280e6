/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/ScratchpadError.hpp"

namespace scratchpad::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::ScratchpadError;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<void> PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    SaveTask task;
    task.filename = filename;
    task.content = content;
    std::future<void> result = task.done.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            task.done.set_exception(std::make_exception_ptr(
                ScratchpadError(ErrorKind::IOError, "persistence service stopped; dropped write to " + filename)));
            return result;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return result;
}

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    saveTextAsync(filename, content).get();
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock
        try {
            performAtomicWrite(task);
            task.done.set_value();
        } catch (const std::exception& e) {
            std::cerr << "[PersistenceService] " << e.what() << std::endl;
            task.done.set_exception(std::current_exception());
        }
    }
}

void PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw ScratchpadError(ErrorKind::IOError, std::string("error creating directories: ") + e.what());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw ScratchpadError(ErrorKind::IOError, "failed to open temp file: " + tempPath.string());
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw ScratchpadError(ErrorKind::IOError, "write failed during output: " + tempPath.string());
        }
    }

    // 3. Atomic Rename
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw ScratchpadError(ErrorKind::IOError, std::string("rename failed: ") + e.what());
    }
}

} // namespace scratchpad::infrastructure
