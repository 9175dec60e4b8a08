#pragma once

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

#include "PlatformDetection.h"

namespace PNGMessage
{
    //Bounds-checked reader over an in-memory PNG byte stream. Integers are read in network byte order.
    //Every read names the error to report when the stream runs out, so callers can tell which
    //part of a record was cut short.
    class ChunkInputStream
    {
        std::span<const Byte> m_bytes;
        std::size_t m_bytesRead = 0;

    public:
        explicit ChunkInputStream(std::span<const Byte> bytes) noexcept :
            m_bytes(bytes)
        {
        }

    public:
        template<std::size_t Count>
        AnyError<Bytes<Count>> Read(PNGError shortfall)
        {
            if(UnreadSize() < Count)
                return tl::unexpected(shortfall);

            Bytes<Count> bytes;
            std::copy_n(m_bytes.begin() + m_bytesRead, Count, bytes.begin());
            m_bytesRead += Count;
            return bytes;
        }

        template<class Ty>
            requires std::integral<Ty> || std::is_enum_v<Ty>
        AnyError<Ty> ReadNative(PNGError shortfall)
        {
            if(auto value = Read<sizeof(Ty)>(shortfall); value)
                return std::bit_cast<Ty>(ToNativeRepresentation(std::move(value).value()));
            else
                return tl::unexpected(std::move(value).error());
        }

        //Returned span aliases the underlying buffer
        AnyError<std::span<const Byte>> ReadSpan(std::size_t count, PNGError shortfall)
        {
            if(UnreadSize() < count)
                return tl::unexpected(shortfall);

            std::span<const Byte> bytes = m_bytes.subspan(m_bytesRead, count);
            m_bytesRead += count;
            return bytes;
        }

        bool HasUnreadData() const noexcept { return m_bytesRead < m_bytes.size(); }

        std::size_t BytesRead() const noexcept { return m_bytesRead; }
        std::size_t UnreadSize() const noexcept { return m_bytes.size() - m_bytesRead; }
    };

    template<class Ty>
        requires std::integral<Ty> || std::is_enum_v<Ty>
    void WriteNative(std::vector<Byte>& bytes, Ty value)
    {
        Bytes<sizeof(Ty)> network = ToNetworkRepresentation(std::bit_cast<Bytes<sizeof(Ty)>>(value));
        bytes.insert(bytes.end(), network.begin(), network.end());
    }

    inline void WriteBytes(std::vector<Byte>& bytes, std::span<const Byte> source)
    {
        bytes.insert(bytes.end(), source.begin(), source.end());
    }
}
