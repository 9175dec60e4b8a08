#pragma once

#include <filesystem>
#include <span>
#include <vector>

#include "PlatformDetection.h"

namespace PNGMessage
{
    AnyError<std::vector<Byte>> ReadWholeFile(const std::filesystem::path& path);

    /// <summary>
    /// Writes to a temporary file beside path, then renames it over path so a failed write
    /// never leaves a truncated file behind
    /// </summary>
    AnyError<void> WriteWholeFile(const std::filesystem::path& path, std::span<const Byte> bytes);
}
