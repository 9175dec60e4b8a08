#include "PNG.h"

#include <algorithm>
#include <numeric>
#include <sstream>

#include "ChunkParser.h"

namespace PNGMessage
{
    PNG::PNG(std::vector<Chunk> chunks) :
        m_chunks(std::move(chunks))
    {
    }

    static AnyError<void> VerifySignature(ChunkInputStream& stream)
    {
        Bytes<PNGSignature.size()> signature;
        if(auto value = stream.Read<PNGSignature.size()>(PNGError::Insufficient_Size); value)
            signature = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        if(signature != PNGSignature)
            return tl::unexpected(PNGError::Unknown_Signature);

        return {};
    }

    AnyError<PNG> PNG::Decode(std::span<const Byte> bytes)
    {
        ChunkInputStream stream{ bytes };

        if(auto value = VerifySignature(stream); !value)
            return tl::unexpected(std::move(value).error());

        std::vector<Chunk> chunks;
        while(stream.HasUnreadData())
        {
            if(auto value = Chunk::Decode(stream); value)
                chunks.push_back(std::move(value).value());
            else
                return tl::unexpected(std::move(value).error());
        }

        return PNG{ std::move(chunks) };
    }

    std::vector<Byte> PNG::Encode() const
    {
        std::size_t totalSize = std::accumulate(m_chunks.begin(), m_chunks.end(), PNGSignature.size(), [](std::size_t val, const Chunk& c) { return val + c.EncodedSize(); });

        std::vector<Byte> bytes;
        bytes.reserve(totalSize);
        WriteBytes(bytes, PNGSignature);

        for(const Chunk& chunk : m_chunks)
            chunk.EncodeTo(bytes);

        return bytes;
    }

    void PNG::AppendChunk(Chunk chunk)
    {
        m_chunks.push_back(std::move(chunk));
    }

    AnyError<Chunk> PNG::RemoveChunk(std::string_view type)
    {
        if(auto value = ChunkType::Create(type); value)
            return RemoveChunk(std::move(value).value());
        else
            return tl::unexpected(std::move(value).error());
    }

    AnyError<Chunk> PNG::RemoveChunk(const ChunkType& type)
    {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const Chunk& chunk) { return chunk.Type() == type; });
        if(it == m_chunks.end())
            return tl::unexpected(PNGError::Chunk_Not_Found);

        Chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const Chunk* PNG::ChunkByType(std::string_view type) const
    {
        if(auto value = ChunkType::Create(type); value)
            return ChunkByType(std::move(value).value());

        return nullptr;
    }

    const Chunk* PNG::ChunkByType(const ChunkType& type) const noexcept
    {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const Chunk& chunk) { return chunk.Type() == type; });
        if(it == m_chunks.end())
            return nullptr;

        return &*it;
    }

    std::string ToString(const PNG& png)
    {
        std::ostringstream stream;
        stream << png;
        return stream.str();
    }

    std::ostream& operator<<(std::ostream& stream, const PNG& png)
    {
        stream << "PNG {\n";
        stream << "  Chunks: " << png.Chunks().size() << "\n";
        for(const Chunk& chunk : png.Chunks())
            stream << chunk << "\n";
        stream << "}";
        return stream;
    }
}
