#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "engine/core/App.hpp"

namespace
{
std::optional<long long> ParseInteger(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    try
    {
        std::size_t consumed = 0;
        const long long value = std::stoll(std::string(text), &consumed);
        if (consumed != text.size())
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

void PrintUsage()
{
    std::cout << "Usage: coinrush [--config <path>] [--frames <n>] [--seed <n>]\n";
}
} // namespace

int main(int argc, char** argv)
{
    engine::core::AppSettings settings;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h")
        {
            PrintUsage();
            return EXIT_SUCCESS;
        }
        if (arg == "--config" && hasValue)
        {
            settings.configPath = argv[++i];
            continue;
        }
        if (arg == "--frames" && hasValue)
        {
            const std::optional<long long> frames = ParseInteger(argv[++i]);
            if (!frames.has_value() || *frames <= 0 || *frames > 10'000'000)
            {
                std::cerr << "[Main] Error: --frames expects a positive integer\n";
                return EXIT_FAILURE;
            }
            settings.maxFrames = static_cast<int>(*frames);
            continue;
        }
        if (arg == "--seed" && hasValue)
        {
            const std::optional<long long> seed = ParseInteger(argv[++i]);
            if (!seed.has_value() || *seed < 0 || *seed > 0xFFFFFFFFLL)
            {
                std::cerr << "[Main] Error: --seed expects a non-negative 32-bit integer\n";
                return EXIT_FAILURE;
            }
            settings.seed = static_cast<unsigned int>(*seed);
            continue;
        }

        std::cerr << "[Main] Error: unknown or incomplete argument '" << arg << "'\n";
        PrintUsage();
        return EXIT_FAILURE;
    }

    engine::core::App app(settings);
    return app.Run() ? EXIT_SUCCESS : EXIT_FAILURE;
}
