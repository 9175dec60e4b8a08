#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "ChunkParser.h"
#include "ChunkType.h"
#include "PlatformDetection.h"

namespace PNGMessage
{
    //CRC-32/ISO-HDLC over the type bytes followed by the data bytes, as stored in every chunk
    std::uint32_t ComputeCrc(ChunkType type, std::span<const Byte> data);

    /// <summary>
    /// A single PNG chunk: length, type, data and CRC. The length and CRC are always derived from the
    /// type and data, so a chunk cannot be built with a stale checksum.
    /// </summary>
    class Chunk
    {
    public:
        static constexpr std::size_t lengthSize = 4;
        static constexpr std::size_t typeSize = 4;
        static constexpr std::size_t crcSize = 4;
        static constexpr std::size_t overheadSize = lengthSize + typeSize + crcSize;

    private:
        ChunkType m_type;
        std::vector<Byte> m_data;
        std::uint32_t m_crc = 0;

    public:
        /// <summary>
        /// Builds a chunk and computes its CRC
        /// </summary>
        /// <exception cref="std::length_error">data holds more bytes than a chunk length can describe</exception>
        Chunk(ChunkType type, std::vector<Byte> data);

    private:
        Chunk(ChunkType type, std::vector<Byte> data, std::uint32_t crc);

    public:
        /// <summary>
        /// Decodes the chunk at the front of bytes. Bytes following the chunk are ignored.
        /// </summary>
        static AnyError<Chunk> Decode(std::span<const Byte> bytes);

        /// <summary>
        /// Decodes exactly one chunk from the stream's current position
        /// </summary>
        static AnyError<Chunk> Decode(ChunkInputStream& stream);

    public:
        std::vector<Byte> Encode() const;
        void EncodeTo(std::vector<Byte>& bytes) const;

        AnyError<std::string> DataAsText() const;

        std::uint32_t Length() const noexcept { return static_cast<std::uint32_t>(m_data.size()); }
        const ChunkType& Type() const noexcept { return m_type; }
        std::span<const Byte> Data() const noexcept { return m_data; }
        std::uint32_t Crc() const noexcept { return m_crc; }
        std::size_t EncodedSize() const noexcept { return overheadSize + m_data.size(); }

        bool operator==(const Chunk& rh) const noexcept { return m_type == rh.m_type && m_crc == rh.m_crc && m_data == rh.m_data; }
        bool operator!=(const Chunk& rh) const noexcept { return !(*this == rh); }
    };

    bool IsValidUtf8(std::span<const Byte> bytes) noexcept;

    std::string ToString(const Chunk& chunk);
    std::ostream& operator<<(std::ostream& stream, const Chunk& chunk);
}
