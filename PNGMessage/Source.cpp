#include <filesystem>
#include <iostream>
#include <span>
#include <string_view>
#include <vector>

#include "Commands.h"

using namespace PNGMessage;

static void PrintUsage(std::ostream& stream)
{
    stream << "Usage:\n";
    stream << "  pngmessage encode <path> <chunk-type> <message> [output-file]\n";
    stream << "  pngmessage decode <path> <chunk-type>\n";
    stream << "  pngmessage remove <path> <chunk-type>\n";
    stream << "  pngmessage print <path>\n";
    stream << "  pngmessage validate <path>\n";
}

static int ReportError(PNGError error)
{
    std::cerr << "Error: " << ToString(error) << "\n";
    return 1;
}

static int RunCommand(std::string_view command, std::span<const std::string_view> args)
{
    if(command == "encode" && (args.size() == 3 || args.size() == 4))
    {
        std::filesystem::path outputPath = args.size() == 4 ? args[3] : defaultOutputFile;
        if(auto value = EncodeMessage(args[0], args[1], args[2], outputPath); !value)
            return ReportError(value.error());

        return 0;
    }

    if(command == "decode" && args.size() == 2)
    {
        auto value = DecodeMessage(args[0], args[1]);
        if(!value)
            return ReportError(value.error());

        if(value->has_value())
            std::cout << **value << "\n";
        else
            std::cout << "Nothing to decode\n";

        return 0;
    }

    if(command == "remove" && args.size() == 2)
    {
        if(auto value = RemoveMessage(args[0], args[1]); !value)
            return ReportError(value.error());

        std::cout << "Removed encoded message\n";
        return 0;
    }

    if(command == "print" && args.size() == 1)
    {
        auto value = PrintChunks(args[0]);
        if(!value)
            return ReportError(value.error());

        std::cout << *value << "\n";
        return 0;
    }

    if(command == "validate" && args.size() == 1)
    {
        if(auto value = ValidateFile(args[0]); !value)
            return ReportError(value.error());

        std::cout << "PNG structure is valid\n";
        return 0;
    }

    PrintUsage(std::cerr);
    return 1;
}

int main(int argc, char** argv)
{
    if(argc < 2)
    {
        PrintUsage(std::cerr);
        return 1;
    }

    std::vector<std::string_view> args(argv + 2, argv + argc);
    return RunCommand(argv[1], args);
}
