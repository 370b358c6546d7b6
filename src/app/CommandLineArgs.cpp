#include "app/CommandLineArgs.hpp"

#include <charconv>
#include <sstream>

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] std::optional<int32_t> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    if (s.front() == '+')
        s.remove_prefix(1);

    int32_t v = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc{} || res.ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

// "ROW,COL"
[[nodiscard]] std::optional<Position> ParsePair(std::string_view s)
{
    const auto comma = s.find(',');
    if (comma == std::string_view::npos)
        return std::nullopt;

    const auto row = ParseInt(s.substr(0, comma));
    const auto col = ParseInt(s.substr(comma + 1));
    if (!row || !col)
        return std::nullopt;
    return Position{ *row, *col };
}

} // namespace

CommandLineArgs ParseCommandLineArgs(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    for (size_t i = 1; i < argv.size(); ++i)
    {
        std::string_view arg = argv[i];
        if (arg.empty())
            continue;

        // split "--opt=value"
        std::optional<std::string_view> inlineValue;
        if (StartsWith(arg, "--"))
        {
            const auto eq = arg.find('=');
            if (eq != std::string_view::npos)
            {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto takeValue = [&]() -> std::optional<std::string_view> {
            if (inlineValue)
                return inlineValue;
            if (i + 1 < argv.size())
                return argv[++i];
            out.errors.push_back(std::string(arg) + " expects a value");
            return std::nullopt;
        };

        auto readInt = [&](int32_t& dst) {
            const auto raw = takeValue();
            if (!raw)
                return;
            if (const auto v = ParseInt(*raw))
                dst = *v;
            else
                out.errors.push_back(std::string(arg) + ": not an integer: " + std::string(*raw));
        };

        auto readPair = [&]() -> std::optional<Position> {
            if (inlineValue)
            {
                const auto p = ParsePair(*inlineValue);
                if (!p)
                    out.errors.push_back(std::string(arg) + " expects ROW,COL: " + std::string(*inlineValue));
                return p;
            }
            if (i + 2 >= argv.size())
            {
                out.errors.push_back(std::string(arg) + " expects ROW COL");
                i = argv.size();
                return std::nullopt;
            }
            const auto row = ParseInt(argv[i + 1]);
            const auto col = ParseInt(argv[i + 2]);
            i += 2;
            if (!row || !col)
            {
                out.errors.push_back(std::string(arg) + " expects two integers");
                return std::nullopt;
            }
            return Position{ *row, *col };
        };

        if (arg == "--help" || arg == "-h")
            out.showHelp = true;
        else if (arg == "--draw-solution")
            out.drawSolution = true;
        else if (arg == "--verbose" || arg == "-v")
            out.verbose = true;
        else if (arg == "--size")
            readInt(out.size);
        else if (arg == "--seed")
            readInt(out.seed);
        else if (arg == "--min-valid-paths")
            readInt(out.minValidPaths);
        else if (arg == "--max-attempts")
            readInt(out.maxAttempts);
        else if (arg == "--start")
        {
            if (const auto p = readPair()) out.start = *p;
        }
        else if (arg == "--goal")
        {
            if (const auto p = readPair()) out.goal = *p;
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (const auto v = takeValue()) out.output = std::filesystem::path(std::string(*v));
        }
        else
            out.unknown.emplace_back(argv[i]);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve((size_t)std::max(argc, 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i]);
    return ParseCommandLineArgs(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream os;
    os << "Generate and visualize mazes using Prim's algorithm\n\n"
       << "usage: stara_maze [options]\n\n"
       << "  --size N              size of the maze (N x N grid, N >= " << kMinMazeSize << "), default 40\n"
       << "  --seed N              random seed for reproducible generation, default 42\n"
       << "  --start ROW COL       start cell, default 1 1\n"
       << "  --goal ROW COL        goal cell, default size-2 size-2\n"
       << "  --min-valid-paths N   routes required between start and goal, default "
       << kDefaultMinValidPaths << "\n"
       << "  --max-attempts N      full re-carves before giving up, default 8\n"
       << "  --output FILE         HTML output, default {size}x{size}_seed{seed}_paths{N}_BFS_maze.html\n"
       << "  --draw-solution       mark the shortest path in the output\n"
       << "  --verbose, -v         debug logging\n"
       << "  --help, -h            show this text\n";
    return os.str();
}

Position ResolveGoal(const CommandLineArgs& args)
{
    if (args.goal)
        return *args.goal;
    return Position{ args.size - 2, args.size - 2 };
}

std::filesystem::path DefaultOutputPath(int32_t size,
                                        int32_t seed,
                                        int32_t minValidPaths,
                                        PathAlgo algo)
{
    std::ostringstream os;
    os << size << "x" << size
       << "_seed" << seed
       << "_paths" << minValidPaths
       << "_" << ToString(algo)
       << "_maze.html";
    return std::filesystem::path(os.str());
}
