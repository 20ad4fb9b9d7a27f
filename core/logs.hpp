#pragma once

namespace junction
{
class Options;

namespace logs
{
// Console sink until the options are known
void preinit();
// throws std::runtime_error if the level is above JUNCTION_LOG_LEVEL
void init(const Options& opt);
}
}
