#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <string_view>

#include <tl/expected.hpp>

namespace PNGMessage
{
    inline constexpr bool IsPlatformNetworkByteOrder = std::endian::native == std::endian::big;
    inline constexpr bool SwapByteOrder = !IsPlatformNetworkByteOrder;

    using Byte = std::uint8_t;

    template<std::size_t Count>
    using Bytes = std::array<Byte, Count>;

    enum class PNGError : int
    {
        Length_Byte_Read,
        Chunk_Type_Byte_Read,
        Data_Byte_Read,
        Crc_Byte_Read,
        Insufficient_Size,
        Chunk_Type_Size_Mismatch,
        Chunk_Type_Not_Alphabetic,
        Chunk_Type_Reserved_Bit_Set,
        Crc_Mismatch,
        Unknown_Signature,
        Chunk_Not_Found,
        Invalid_Text_Encoding,
        File_Open_Failure,
        File_Read_Failure,
        File_Write_Failure,
        No_Chunks_Found,
        Header_Not_First,
        Trailer_Not_Last,
        Duplicate_Chunk,
        Missing_Required_Chunk
    };

    template<class Ty>
    using AnyError = tl::expected<Ty, PNGError>;

    std::string_view ToString(PNGError error) noexcept;

    //Buffer ended before the named part of a chunk or file could be read
    constexpr bool IsTruncatedInput(PNGError error) noexcept
    {
        switch(error)
        {
        case PNGError::Length_Byte_Read:
        case PNGError::Chunk_Type_Byte_Read:
        case PNGError::Data_Byte_Read:
        case PNGError::Crc_Byte_Read:
        case PNGError::Insufficient_Size:
            return true;
        default:
            return false;
        }
    }

    constexpr bool IsChunkTypeError(PNGError error) noexcept
    {
        return error == PNGError::Chunk_Type_Size_Mismatch ||
            error == PNGError::Chunk_Type_Not_Alphabetic ||
            error == PNGError::Chunk_Type_Reserved_Bit_Set;
    }

    template<std::size_t Count>
    constexpr Bytes<Count> FlipEndianness(Bytes<Count> bytes)
    {
        Bytes<Count> newBytes;
        std::reverse_copy(bytes.begin(), bytes.end(), newBytes.begin());
        return newBytes;
    }

    //PNG stores every integer in network byte order
    template<std::size_t Count>
    constexpr Bytes<Count> ToNativeRepresentation(Bytes<Count> bytes)
    {
        if constexpr(SwapByteOrder)
            return FlipEndianness(bytes);
        else
            return bytes;
    }

    template<std::size_t Count>
    constexpr Bytes<Count> ToNetworkRepresentation(Bytes<Count> bytes)
    {
        return ToNativeRepresentation(bytes);
    }

    inline constexpr Bytes<8> PNGSignature = Bytes<8>{ 137, 80, 78, 71, 13, 10, 26, 10 };
}
