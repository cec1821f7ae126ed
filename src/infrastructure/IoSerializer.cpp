/**
 * @file IoSerializer.cpp
 * @brief Implementation of IoSerializer.
 */

#include "infrastructure/IoSerializer.hpp"
#include "infrastructure/Log.hpp"

namespace lancollect::infrastructure {

IoSerializer::Guard IoSerializer::acquire(const std::string& reason) {
    Guard guard(m_mutex);
    if (!reason.empty()) {
        Log::Debug("IoSerializer", "Entered write region: " + reason);
    }
    return guard;
}

} // namespace lancollect::infrastructure
