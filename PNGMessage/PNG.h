#pragma once

#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Chunk.h"
#include "PlatformDetection.h"

namespace PNGMessage
{
    /// <summary>
    /// A PNG file held in memory as its signature followed by its chunks, in file order.
    /// No PNG structural rules are enforced here, see VerifyStructure.
    /// </summary>
    class PNG
    {
        std::vector<Chunk> m_chunks;

    public:
        PNG() = default;
        explicit PNG(std::vector<Chunk> chunks);

    public:
        /// <summary>
        /// Verifies the signature then decodes chunks until the buffer is exhausted.
        /// The first chunk that fails to decode fails the whole file.
        /// </summary>
        static AnyError<PNG> Decode(std::span<const Byte> bytes);

    public:
        std::vector<Byte> Encode() const;

        void AppendChunk(Chunk chunk);
        AnyError<Chunk> RemoveChunk(std::string_view type);
        AnyError<Chunk> RemoveChunk(const ChunkType& type);

        const Chunk* ChunkByType(std::string_view type) const;
        const Chunk* ChunkByType(const ChunkType& type) const noexcept;

        std::span<const Chunk> Chunks() const noexcept { return m_chunks; }
    };

    std::string ToString(const PNG& png);
    std::ostream& operator<<(std::ostream& stream, const PNG& png);
}
