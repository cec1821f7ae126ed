/**
 * @file IoSerializer.hpp
 * @brief Process-wide exclusive region for versioned writes.
 */

#pragma once
#include <mutex>
#include <string>

namespace lancollect::infrastructure {

/**
 * @class IoSerializer
 * @brief Owns the single lock that makes "list existing -> compute next
 * version -> write" atomic among writers of this process.
 *
 * One instance is created by the service container and handed to every
 * writer. The lock is coarse: all collection folders share it.
 */
class IoSerializer {
public:
    /**
     * @class Guard
     * @brief Scoped ownership of the region; released when destroyed.
     */
    class Guard {
    public:
        Guard(Guard&&) = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        friend class IoSerializer;
        explicit Guard(std::mutex& mutex) : m_lock(mutex) {}
        std::unique_lock<std::mutex> m_lock;
    };

    IoSerializer() = default;
    IoSerializer(const IoSerializer&) = delete;
    IoSerializer& operator=(const IoSerializer&) = delete;

    /**
     * @brief Blocks until the region is free and enters it.
     * @param reason Short description used in debug logs.
     */
    Guard acquire(const std::string& reason = "");

private:
    std::mutex m_mutex;
};

} // namespace lancollect::infrastructure
