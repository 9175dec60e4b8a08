#include "PlatformDetection.h"

namespace PNGMessage
{
    std::string_view ToString(PNGError error) noexcept
    {
        switch(error)
        {
        case PNGError::Length_Byte_Read:
            return "Not enough bytes to read the chunk length";
        case PNGError::Chunk_Type_Byte_Read:
            return "Not enough bytes to read the chunk type";
        case PNGError::Data_Byte_Read:
            return "Not enough bytes to read the chunk data";
        case PNGError::Crc_Byte_Read:
            return "Not enough bytes to read the chunk CRC";
        case PNGError::Insufficient_Size:
            return "File is too small to hold a PNG signature";
        case PNGError::Chunk_Type_Size_Mismatch:
            return "Chunk type must be exactly 4 characters";
        case PNGError::Chunk_Type_Not_Alphabetic:
            return "Chunk type must only contain alphabetical characters";
        case PNGError::Chunk_Type_Reserved_Bit_Set:
            return "Chunk type has its reserved bit set (third letter must be uppercase)";
        case PNGError::Crc_Mismatch:
            return "Stored chunk CRC does not match the computed CRC";
        case PNGError::Unknown_Signature:
            return "PNG signature could not be matched";
        case PNGError::Chunk_Not_Found:
            return "No chunk of the requested type was found";
        case PNGError::Invalid_Text_Encoding:
            return "Chunk data is not valid UTF-8";
        case PNGError::File_Open_Failure:
            return "File could not be opened";
        case PNGError::File_Read_Failure:
            return "File could not be read";
        case PNGError::File_Write_Failure:
            return "File could not be written";
        case PNGError::No_Chunks_Found:
            return "PNG contains no chunks";
        case PNGError::Header_Not_First:
            return "First chunk is not IHDR";
        case PNGError::Trailer_Not_Last:
            return "IEND is missing or is not the last chunk";
        case PNGError::Duplicate_Chunk:
            return "A chunk that may only appear once appears more than once";
        case PNGError::Missing_Required_Chunk:
            return "A required chunk is missing";
        }

        return "Unknown error";
    }
}
