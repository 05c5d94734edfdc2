#pragma once

#include "qrseq/tool/config.hpp"

namespace qrseq::tool
{

    // Each returns a process exit status.
    int run_split(const ToolConfig &config);
    int run_join(const ToolConfig &config);
    int run_status(const ToolConfig &config);

} // namespace qrseq::tool
