#pragma once

#include <array>
#include <string_view>

#include "ChunkType.h"

namespace PNGMessage
{
    struct ChunkDescription
    {
        ChunkType identifier;
        std::string_view name;
        bool isOptional;
        bool multipleAllowed;
    };

    //PLTE is marked optional; whether it is required depends on the IHDR colour type
    inline constexpr auto standardChunks = std::to_array<ChunkDescription>({
        { ChunkIdentifiers::header, "Image Header", false, false },
        { ChunkIdentifiers::palette, "Palette", true, false },
        { ChunkIdentifiers::imageData, "Image Data", false, true },
        { ChunkIdentifiers::imageTrailer, "Image Trailer", false, false },
        { ChunkIdentifiers::chromaticities, "Chromaticities", true, false },
        { ChunkIdentifiers::imageGamma, "Image Gamma", true, false },
        { ChunkIdentifiers::iccProfile, "ICC Profile", true, false },
        { ChunkIdentifiers::significantBits, "Significant Bits", true, false },
        { ChunkIdentifiers::rgbColorSpace, "Standard RGB Color Space", true, false },
        { ChunkIdentifiers::backgroundColor, "Background Color", true, false },
        { ChunkIdentifiers::imageHistogram, "Image Histogram", true, false },
        { ChunkIdentifiers::transparency, "Transparency", true, false },
        { ChunkIdentifiers::physicalPixelDimensions, "Physical Pixel Dimensions", true, false },
        { ChunkIdentifiers::suggestedPalette, "Suggested Palette", true, true },
        { ChunkIdentifiers::lastModificationTime, "Last Modification Time", true, false },
        { ChunkIdentifiers::internationalTextualData, "International Text Data", true, true },
        { ChunkIdentifiers::texturalData, "Text Data", true, true },
        { ChunkIdentifiers::compressedTextualData, "Compressed Text Data", true, true } });

    /// <summary>
    /// Looks up one of the chunk types defined by the PNG standard
    /// </summary>
    /// <returns>nullptr for private or otherwise unknown chunk types</returns>
    const ChunkDescription* FindChunkDescription(const ChunkType& type) noexcept;
}
