#include "session/session_storage.h"
#include "session/session_config.h"
#include "session/session_error.h"
#include "log/logger.h"

namespace zsession
{
    void validate_max_age(const std::chrono::seconds max_age)
    {
        if (max_age < kMinimumMaxAge)
        {
            ZSESSION_LOG_ERROR("Rejecting session max age of {} seconds, minimum is {}",
                               max_age.count(), kMinimumMaxAge.count());
            throw ValidationException("maxAge duration too short");
        }
    }
} // namespace zsession
