/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace agentdeck::infrastructure {

namespace fs = std::filesystem;

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

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content, bool ownerOnly) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(SaveTask{SaveTask::Kind::Write, filename, content, ownerOnly});
    }
    m_cv.notify_one();
}

void PersistenceService::removeAsync(const std::string& filename) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(SaveTask{SaveTask::Kind::Remove, filename, {}, false});
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_running) {
        return; // stop() already drained the queue.
    }
    m_idleCv.wait(lock, [this] { return m_queue.empty() && !m_busy; });
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
                m_idleCv.notify_all();
                return; // Exit point
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        perform(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::perform(const SaveTask& task) {
    if (task.kind == SaveTask::Kind::Remove) {
        std::error_code ec;
        fs::remove(task.filename, ec);
        if (ec) {
            std::cerr << "[PersistenceService] Failed to remove " << task.filename << ": " << ec.message() << std::endl;
        }
        return;
    }

    try {
        WriteFileAtomically(task.filename, task.content, task.ownerOnly);
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] " << e.what() << std::endl;
    }
}

void PersistenceService::WriteFileAtomically(const std::string& filename, const std::string& content, bool ownerOnly) {
    fs::path finalPath = filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Error creating directories for " + filename + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        if (ownerOnly) {
            fs::permissions(tempPath, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed during output: " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tempPath, ec);
        throw std::runtime_error("Rename failed for " + filename + ": " + reason);
    }
}

} // namespace agentdeck::infrastructure
