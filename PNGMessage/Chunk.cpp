#include "Chunk.h"

#include <limits>
#include <sstream>
#include <stdexcept>

#include <zlib.h>

#include "ChunkCatalogue.h"

namespace PNGMessage
{
    std::uint32_t ComputeCrc(ChunkType type, std::span<const Byte> data)
    {
        Bytes<4> typeBytes = type.ToBytes();

        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, typeBytes.data(), static_cast<uInt>(typeBytes.size()));
        if(!data.empty())
            crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));

        return static_cast<std::uint32_t>(crc);
    }

    Chunk::Chunk(ChunkType type, std::vector<Byte> data) :
        m_type(type),
        m_data(std::move(data))
    {
        if(m_data.size() > std::numeric_limits<std::uint32_t>::max())
            throw std::length_error("Chunk data exceeds the maximum chunk length");

        m_crc = ComputeCrc(m_type, m_data);
    }

    Chunk::Chunk(ChunkType type, std::vector<Byte> data, std::uint32_t crc) :
        m_type(type),
        m_data(std::move(data)),
        m_crc(crc)
    {
    }

    AnyError<Chunk> Chunk::Decode(std::span<const Byte> bytes)
    {
        ChunkInputStream stream{ bytes };
        return Decode(stream);
    }

    AnyError<Chunk> Chunk::Decode(ChunkInputStream& stream)
    {
        std::uint32_t length;
        if(auto value = stream.ReadNative<std::uint32_t>(PNGError::Length_Byte_Read); value)
            length = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        ChunkType type;
        if(auto value = stream.Read<typeSize>(PNGError::Chunk_Type_Byte_Read); value)
        {
            if(auto value2 = ChunkType::Create(std::move(value).value()); value2)
                type = std::move(value2).value();
            else
                return tl::unexpected(std::move(value2).error());
        }
        else
            return tl::unexpected(std::move(value).error());

        if(!type.IsValid())
            return tl::unexpected(PNGError::Chunk_Type_Reserved_Bit_Set);

        std::span<const Byte> data;
        if(auto value = stream.ReadSpan(length, PNGError::Data_Byte_Read); value)
            data = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        std::uint32_t storedCrc;
        if(auto value = stream.ReadNative<std::uint32_t>(PNGError::Crc_Byte_Read); value)
            storedCrc = std::move(value).value();
        else
            return tl::unexpected(std::move(value).error());

        if(ComputeCrc(type, data) != storedCrc)
            return tl::unexpected(PNGError::Crc_Mismatch);

        return Chunk{ type, std::vector<Byte>(data.begin(), data.end()), storedCrc };
    }

    std::vector<Byte> Chunk::Encode() const
    {
        std::vector<Byte> bytes;
        bytes.reserve(EncodedSize());
        EncodeTo(bytes);
        return bytes;
    }

    void Chunk::EncodeTo(std::vector<Byte>& bytes) const
    {
        Bytes<4> typeBytes = m_type.ToBytes();

        WriteNative(bytes, Length());
        WriteBytes(bytes, typeBytes);
        WriteBytes(bytes, m_data);
        WriteNative(bytes, m_crc);
    }

    AnyError<std::string> Chunk::DataAsText() const
    {
        if(!IsValidUtf8(m_data))
            return tl::unexpected(PNGError::Invalid_Text_Encoding);

        return std::string(m_data.begin(), m_data.end());
    }

    bool IsValidUtf8(std::span<const Byte> bytes) noexcept
    {
        std::size_t i = 0;
        while(i < bytes.size())
        {
            Byte lead = bytes[i];
            std::size_t continuationCount;
            std::uint32_t codePoint;

            if(lead < 0x80)
            {
                i++;
                continue;
            }
            else if((lead & 0xE0) == 0xC0)
            {
                continuationCount = 1;
                codePoint = lead & 0x1F;
            }
            else if((lead & 0xF0) == 0xE0)
            {
                continuationCount = 2;
                codePoint = lead & 0x0F;
            }
            else if((lead & 0xF8) == 0xF0)
            {
                continuationCount = 3;
                codePoint = lead & 0x07;
            }
            else
            {
                return false;
            }

            if(bytes.size() - i - 1 < continuationCount)
                return false;

            for(std::size_t j = 1; j <= continuationCount; j++)
            {
                Byte continuation = bytes[i + j];
                if((continuation & 0xC0) != 0x80)
                    return false;

                codePoint = (codePoint << 6) | (continuation & 0x3F);
            }

            //Reject overlong forms, UTF-16 surrogates and anything past U+10FFFF
            constexpr std::uint32_t minimumCodePoint[] = { 0, 0x80, 0x800, 0x10000 };
            if(codePoint < minimumCodePoint[continuationCount])
                return false;
            if(codePoint >= 0xD800 && codePoint <= 0xDFFF)
                return false;
            if(codePoint > 0x10FFFF)
                return false;

            i += continuationCount + 1;
        }

        return true;
    }

    std::string ToString(const Chunk& chunk)
    {
        std::ostringstream stream;
        stream << chunk;
        return stream.str();
    }

    std::ostream& operator<<(std::ostream& stream, const Chunk& chunk)
    {
        const ChunkType& type = chunk.Type();

        stream << "Chunk {\n";
        stream << "  Length: " << chunk.Length() << "\n";
        stream << "  Type: " << type;
        if(const ChunkDescription* description = FindChunkDescription(type); description)
            stream << " (" << description->name << ")";
        stream << "\n";
        stream << "  Properties: " << (type.IsCritical() ? "critical" : "ancillary")
            << ", " << (type.IsPublic() ? "public" : "private")
            << ", " << (type.IsSafeToCopy() ? "safe to copy" : "unsafe to copy") << "\n";
        stream << "  Data: " << chunk.Data().size() << " bytes\n";
        stream << "  Crc: " << chunk.Crc() << "\n";
        stream << "}";
        return stream;
    }
}
