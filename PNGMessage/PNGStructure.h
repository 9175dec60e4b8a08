#pragma once

#include "PNG.h"
#include "PlatformDetection.h"

namespace PNGMessage
{
    /// <summary>
    /// Checks chunk ordering rules that PNG::Decode deliberately leaves alone:
    /// IHDR first, IEND last and only once, required chunks present, and single-instance
    /// standard chunks not repeated. Private and unknown chunks are not restricted.
    /// </summary>
    AnyError<void> VerifyStructure(const PNG& png);
}
