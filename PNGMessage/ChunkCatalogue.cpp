#include "ChunkCatalogue.h"

#include <algorithm>

namespace PNGMessage
{
    const ChunkDescription* FindChunkDescription(const ChunkType& type) noexcept
    {
        auto it = std::find_if(standardChunks.begin(), standardChunks.end(), [&type](const ChunkDescription& description) { return description.identifier == type; });

        if(it == standardChunks.end())
            return nullptr;

        return &*it;
    }
}
