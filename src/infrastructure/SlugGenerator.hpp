/**
 * @file SlugGenerator.hpp
 * @brief Random public slugs and task identifiers.
 */

#pragma once
#include <mutex>
#include <random>
#include <string>

namespace lancollect::infrastructure {

/**
 * @class SlugGenerator
 * @brief Produces fresh identifiers on every call.
 *
 * Slugs are 14 characters drawn from an alphabet without look-alike
 * characters (no I, O, 0, 1). Virtual so collisions can be forced in tests.
 */
class SlugGenerator {
public:
    static constexpr const char* kAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
    static constexpr int kSlugLength = 14;

    SlugGenerator();
    virtual ~SlugGenerator() = default;

    virtual std::string generateSlug();

    /** @brief Random version-4 UUID in canonical text form. */
    virtual std::string generateTaskId();

private:
    std::mutex m_mutex;
    std::mt19937_64 m_engine;
};

} // namespace lancollect::infrastructure
