#pragma once

#include <filesystem>
#include <optional>

namespace qrseq::tool
{

    // Installs the default spdlog logger: coloured stderr plus an optional file.
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace qrseq::tool
