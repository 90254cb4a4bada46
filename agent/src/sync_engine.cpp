#include "fleetsync/agent/sync_engine.hpp"

namespace fleetsync::agent
{

    EngineError::EngineError(fleetsync::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace fleetsync::agent
