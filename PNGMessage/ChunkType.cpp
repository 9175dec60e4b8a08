#include "ChunkType.h"

#include <algorithm>

namespace PNGMessage
{
    AnyError<ChunkType> ChunkType::Create(Bytes<4> bytes)
    {
        if(!std::all_of(bytes.begin(), bytes.end(), IsAlphabetic))
            return tl::unexpected(PNGError::Chunk_Type_Not_Alphabetic);

        ChunkType type;
        type.m_identifier = std::bit_cast<std::array<char, 4>>(bytes);
        return type;
    }

    AnyError<ChunkType> ChunkType::Create(std::string_view string)
    {
        if(string.size() != 4)
            return tl::unexpected(PNGError::Chunk_Type_Size_Mismatch);

        Bytes<4> bytes;
        std::transform(string.begin(), string.end(), bytes.begin(), [](char c) { return static_cast<Byte>(c); });
        return Create(bytes);
    }
}
