#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "Chunk.h"
#include "PNG.h"
#include "PlatformDetection.h"

namespace PNGMessage
{
    inline constexpr std::string_view defaultOutputFile = "output.png";

    AnyError<PNG> LoadPNG(const std::filesystem::path& path);
    AnyError<void> SavePNG(const PNG& png, const std::filesystem::path& path);

    /// <summary>
    /// Appends a chunk holding message to the PNG at path and writes the result to outputPath
    /// </summary>
    AnyError<void> EncodeMessage(const std::filesystem::path& path, std::string_view chunkType, std::string_view message, const std::filesystem::path& outputPath);

    /// <returns>The text of the first chunk of chunkType, or std::nullopt when the file has none</returns>
    AnyError<std::optional<std::string>> DecodeMessage(const std::filesystem::path& path, std::string_view chunkType);

    /// <summary>
    /// Removes the first chunk of chunkType and writes the file back in place
    /// </summary>
    AnyError<Chunk> RemoveMessage(const std::filesystem::path& path, std::string_view chunkType);

    AnyError<std::string> PrintChunks(const std::filesystem::path& path);

    AnyError<void> ValidateFile(const std::filesystem::path& path);
}
