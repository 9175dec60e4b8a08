#include "Commands.h"

#include <vector>

#include "FileIO.h"
#include "PNGStructure.h"

namespace PNGMessage
{
    AnyError<PNG> LoadPNG(const std::filesystem::path& path)
    {
        if(auto value = ReadWholeFile(path); value)
            return PNG::Decode(std::move(value).value());
        else
            return tl::unexpected(std::move(value).error());
    }

    AnyError<void> SavePNG(const PNG& png, const std::filesystem::path& path)
    {
        return WriteWholeFile(path, png.Encode());
    }

    AnyError<void> EncodeMessage(const std::filesystem::path& path, std::string_view chunkType, std::string_view message, const std::filesystem::path& outputPath)
    {
        ChunkType type;
        if(auto value = ChunkType::Create(chunkType); value)
            type = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        //Such a chunk could be written but never read back
        if(!type.IsValid())
            return tl::unexpected(PNGError::Chunk_Type_Reserved_Bit_Set);

        PNG png;
        if(auto value = LoadPNG(path); value)
            png = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        png.AppendChunk(Chunk{ type, std::vector<Byte>(message.begin(), message.end()) });
        return SavePNG(png, outputPath);
    }

    AnyError<std::optional<std::string>> DecodeMessage(const std::filesystem::path& path, std::string_view chunkType)
    {
        ChunkType type;
        if(auto value = ChunkType::Create(chunkType); value)
            type = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        PNG png;
        if(auto value = LoadPNG(path); value)
            png = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        const Chunk* chunk = png.ChunkByType(type);
        if(!chunk)
            return std::optional<std::string>{};

        if(auto value = chunk->DataAsText(); value)
            return std::optional<std::string>{ std::move(value).value() };
        else
            return tl::unexpected(std::move(value).error());
    }

    AnyError<Chunk> RemoveMessage(const std::filesystem::path& path, std::string_view chunkType)
    {
        PNG png;
        if(auto value = LoadPNG(path); value)
            png = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        auto removed = png.RemoveChunk(chunkType);
        if(!removed)
            return removed;

        if(auto value = SavePNG(png, path); !value)
            return tl::unexpected(std::move(value).error());

        return removed;
    }

    AnyError<std::string> PrintChunks(const std::filesystem::path& path)
    {
        if(auto value = LoadPNG(path); value)
            return ToString(std::move(value).value());
        else
            return tl::unexpected(std::move(value).error());
    }

    AnyError<void> ValidateFile(const std::filesystem::path& path)
    {
        if(auto value = LoadPNG(path); value)
            return VerifyStructure(std::move(value).value());
        else
            return tl::unexpected(std::move(value).error());
    }
}
