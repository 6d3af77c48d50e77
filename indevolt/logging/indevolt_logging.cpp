#include "indevolt/logging/indevolt_logging.hpp"

namespace indevolt
{
namespace logging
{

LogLevel current_log_level = LogLevel::Info;

} // namespace logging
} // namespace indevolt
