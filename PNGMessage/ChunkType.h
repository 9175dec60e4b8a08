#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string_view>

#include "PlatformDetection.h"

namespace PNGMessage
{
    constexpr bool IsUppercase(Byte b)
    {
        return b >= 'A' && b <= 'Z';
    }

    constexpr bool IsLowercase(Byte b)
    {
        return b >= 'a' && b <= 'z';
    }

    constexpr bool IsAlphabetic(Byte b)
    {
        return IsUppercase(b) || IsLowercase(b);
    }

    /// <summary>
    /// Four letter chunk type code. The case of each letter (bit 5 of each byte) carries a property:
    /// ancillary, private, reserved and safe-to-copy, in that order.
    /// </summary>
    /// <remarks>
    /// Construction rejects anything but ASCII letters. A code with its reserved bit set can still be
    /// constructed so it may be inspected, but IsValid() reports it as unusable.
    /// </remarks>
    class ChunkType
    {
        static constexpr Byte propertyBit = 0b0010'0000;

        std::array<char, 4> m_identifier{};

    public:
        constexpr ChunkType() = default;
        friend constexpr ChunkType operator""_ct(const char* string, std::size_t n);

    public:
        static AnyError<ChunkType> Create(Bytes<4> bytes);
        static AnyError<ChunkType> Create(std::string_view string);

    public:
        constexpr bool IsCritical() const noexcept { return (PropertyByte(0) & propertyBit) == 0; }
        constexpr bool IsPublic() const noexcept { return (PropertyByte(1) & propertyBit) == 0; }
        constexpr bool IsReservedBitValid() const noexcept { return (PropertyByte(2) & propertyBit) == 0; }
        constexpr bool IsSafeToCopy() const noexcept { return (PropertyByte(3) & propertyBit) != 0; }
        constexpr bool IsValid() const noexcept { return IsReservedBitValid(); }

        constexpr Bytes<4> ToBytes() const noexcept { return std::bit_cast<Bytes<4>>(m_identifier); }
        constexpr std::string_view ToString() const noexcept { return { m_identifier.data(), m_identifier.size() }; }

        constexpr bool operator==(const ChunkType& rh) const noexcept { return m_identifier == rh.m_identifier; }
        constexpr bool operator!=(const ChunkType& rh) const noexcept { return m_identifier != rh.m_identifier; }
        constexpr bool operator<(const ChunkType& rh) const noexcept { return ToBytes() < rh.ToBytes(); }

    private:
        constexpr Byte PropertyByte(std::size_t index) const noexcept { return static_cast<Byte>(m_identifier[index]); }
    };

    constexpr ChunkType operator""_ct(const char* string, std::size_t n)
    {
        if(n != 4)
            throw std::invalid_argument("Expected string size to be 4");

        ChunkType type;
        for(std::size_t i = 0; i < 4; i++)
        {
            if(!IsAlphabetic(static_cast<Byte>(string[i])))
                throw std::invalid_argument("String must only contain Alphabetical characters");

            type.m_identifier[i] = string[i];
        }
        return type;
    }

    inline std::ostream& operator<<(std::ostream& stream, const ChunkType& type)
    {
        return stream << type.ToString();
    }

    namespace ChunkIdentifiers
    {
        constexpr ChunkType header = "IHDR"_ct;
        constexpr ChunkType palette = "PLTE"_ct;
        constexpr ChunkType imageData = "IDAT"_ct;
        constexpr ChunkType imageTrailer = "IEND"_ct;
        constexpr ChunkType chromaticities = "cHRM"_ct;
        constexpr ChunkType imageGamma = "gAMA"_ct;
        constexpr ChunkType iccProfile = "iCCP"_ct;
        constexpr ChunkType significantBits = "sBIT"_ct;
        constexpr ChunkType rgbColorSpace = "sRGB"_ct;
        constexpr ChunkType backgroundColor = "bKGD"_ct;
        constexpr ChunkType imageHistogram = "hIST"_ct;
        constexpr ChunkType transparency = "tRNS"_ct;
        constexpr ChunkType physicalPixelDimensions = "pHYs"_ct;
        constexpr ChunkType suggestedPalette = "sPLT"_ct;
        constexpr ChunkType lastModificationTime = "tIME"_ct;
        constexpr ChunkType internationalTextualData = "iTXt"_ct;
        constexpr ChunkType texturalData = "tEXt"_ct;
        constexpr ChunkType compressedTextualData = "zTXt"_ct;
    }
}
