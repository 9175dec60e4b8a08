#include "PNGStructure.h"

#include <algorithm>
#include <map>

#include "ChunkCatalogue.h"

namespace PNGMessage
{
    AnyError<void> VerifyStructure(const PNG& png)
    {
        std::span<const Chunk> chunks = png.Chunks();
        if(chunks.empty())
            return tl::unexpected(PNGError::No_Chunks_Found);

        if(chunks.front().Type() != ChunkIdentifiers::header)
            return tl::unexpected(PNGError::Header_Not_First);

        auto trailer = std::find_if(chunks.begin(), chunks.end(), [](const Chunk& chunk) { return chunk.Type() == ChunkIdentifiers::imageTrailer; });
        if(trailer == chunks.end() || trailer != chunks.end() - 1)
            return tl::unexpected(PNGError::Trailer_Not_Last);

        std::map<ChunkType, std::size_t> occurrences;
        for(const Chunk& chunk : chunks)
        {
            const ChunkDescription* description = FindChunkDescription(chunk.Type());
            if(!description)
                continue;

            if(++occurrences[chunk.Type()] > 1 && !description->multipleAllowed)
                return tl::unexpected(PNGError::Duplicate_Chunk);
        }

        for(const ChunkDescription& description : standardChunks)
        {
            if(!description.isOptional && !occurrences.contains(description.identifier))
                return tl::unexpected(PNGError::Missing_Required_Chunk);
        }

        return {};
    }
}
