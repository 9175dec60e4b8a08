#include "FileIO.h"

#include <fstream>
#include <system_error>

#include "ScopeGuard.h"

namespace PNGMessage
{
    AnyError<std::vector<Byte>> ReadWholeFile(const std::filesystem::path& path)
    {
        std::ifstream file{ path, std::ios::binary | std::ios::ate };
        if(!file.is_open())
            return tl::unexpected(PNGError::File_Open_Failure);

        std::streamoff size = file.tellg();
        if(size < 0)
            return tl::unexpected(PNGError::File_Read_Failure);

        std::vector<Byte> bytes(static_cast<std::size_t>(size));
        file.seekg(0, std::ios::beg);
        if(!file.read(reinterpret_cast<char*>(bytes.data()), size))
            return tl::unexpected(PNGError::File_Read_Failure);

        return bytes;
    }

    AnyError<void> WriteWholeFile(const std::filesystem::path& path, std::span<const Byte> bytes)
    {
        std::filesystem::path temporaryPath = path;
        temporaryPath += ".tmp";

        ScopeGuard removeTemporary{ [&temporaryPath]
        {
            std::error_code ignored;
            std::filesystem::remove(temporaryPath, ignored);
        } };

        {
            std::ofstream file{ temporaryPath, std::ios::binary | std::ios::trunc };
            if(!file.is_open())
                return tl::unexpected(PNGError::File_Write_Failure);

            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            file.close();
            if(!file)
                return tl::unexpected(PNGError::File_Write_Failure);
        }

        std::error_code error;
        std::filesystem::rename(temporaryPath, path, error);
        if(error)
            return tl::unexpected(PNGError::File_Write_Failure);

        removeTemporary.Disengage();
        return {};
    }
}
