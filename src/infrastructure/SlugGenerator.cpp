/**
 * @file SlugGenerator.cpp
 * @brief Implementation of SlugGenerator.
 */

#include "infrastructure/SlugGenerator.hpp"
#include <cstring>

namespace lancollect::infrastructure {

SlugGenerator::SlugGenerator() {
    std::random_device rd;
    std::seed_seq seed{rd(), rd(), rd(), rd()};
    m_engine.seed(seed);
}

std::string SlugGenerator::generateSlug() {
    static const std::size_t alphabetSize = std::strlen(kAlphabet);
    std::uniform_int_distribution<std::size_t> pick(0, alphabetSize - 1);

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string slug;
    slug.reserve(kSlugLength);
    for (int i = 0; i < kSlugLength; ++i) {
        slug += kAlphabet[pick(m_engine)];
    }
    return slug;
}

std::string SlugGenerator::generateTaskId() {
    static const char* hex = "0123456789abcdef";
    std::uniform_int_distribution<int> nibble(0, 15);

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) id += '-';
        int value = nibble(m_engine);
        if (i == 12) value = 4;                      // version
        if (i == 16) value = 8 + (value & 0x3);      // variant 10xx
        id += hex[value];
    }
    return id;
}

} // namespace lancollect::infrastructure
