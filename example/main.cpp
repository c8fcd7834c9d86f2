// example/main.cpp: tenda command line: runs a script or an interactive session
#include "TendaEngine.hpp"
#include "TendaLexer.hpp"
#include "TendaPrelude.hpp"
#include "TendaReporter.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

struct Options
{
    std::string scriptPath;
    int maxDepth = 0;
};

static void printUsage(const char *argv0)
{
    std::cerr << "uso: " << argv0 << " [--max-depth N] [script.tenda]\n"
              << "  --max-depth N   chamadas aninhadas permitidas (1.." << tenda::MAX_RECURSION_DEPTH
              << ", padrão 500)\n";
}

static bool parseOptions(int argc, char *argv[], Options &opts)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-depth") {
            if (i + 1 >= argc)
                return false;
            char *end = nullptr;
            long depth = std::strtol(argv[++i], &end, 10);
            if (*end != '\0' || depth <= 0 || static_cast<unsigned long>(depth) > tenda::MAX_RECURSION_DEPTH)
                return false;
            opts.maxDepth = static_cast<int>(depth);
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (opts.scriptPath.empty()) {
            opts.scriptPath = arg;
        } else {
            return false;
        }
    }
    return true;
}

static bool readFile(const std::string &path, std::string &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static std::string directoryOf(const std::string &path)
{
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos)
        return "";
    return path.substr(0, slash + 1);
}

// Modules are looked up beside the script: id, id.tenda, id.tnd
static void installResolver(tenda::Engine &engine, const std::string &baseDir)
{
    engine.setModuleResolver([baseDir](const std::string &id, std::string &source) {
        for (const char *ext : {"", ".tenda", ".tnd"}) {
            if (readFile(baseDir + id + ext, source))
                return true;
        }
        return false;
    });
}

static int runScript(tenda::Engine &engine, const std::string &path)
{
    std::string source;
    if (!readFile(path, source)) {
        std::cerr << "erro: não foi possível abrir '" << path << "'\n";
        return 1;
    }
    installResolver(engine, directoryOf(path));

    try {
        auto result = engine.run(source);
        if (!result) {
            std::cerr << tenda::Reporter::render(result.diagnostic, path, source);
            return 1;
        }
    } catch (const tenda::SyntaxError &e) {
        std::cerr << tenda::Reporter::render(e, path, source);
        return 1;
    }
    return 0;
}

static int countLines(const std::string &s)
{
    return static_cast<int>(std::count(s.begin(), s.end(), '\n')) + 1;
}

static void runInteractive(tenda::Engine &engine)
{
    installResolver(engine, "");

    std::string buffer;
    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        buffer += buffer.empty() ? line : "\n" + line;

        try {
            auto result = engine.run(buffer);
            if (!result)
                std::cerr << tenda::Reporter::render(result.diagnostic, "<entrada>", buffer);
            else if (!result.value.isNil())
                std::cout << result.value.repr() << "\n";
            buffer.clear();
        } catch (const tenda::SyntaxError &e) {
            // Unfinished block: keep reading until a blank line
            if (!line.empty() && e.line() >= countLines(buffer)) {
                std::cout << ". " << std::flush;
                continue;
            }
            std::cerr << tenda::Reporter::render(e, "<entrada>", buffer);
            buffer.clear();
        }
        std::cout << "> " << std::flush;
    }
    std::cout << "\n";
}

int main(int argc, char *argv[])
{
    Options opts;
    if (!parseOptions(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    tenda::Engine engine;
    tenda::Prelude::install(engine);
    if (opts.maxDepth > 0)
        engine.setMaxRecursionDepth(opts.maxDepth);

    if (!opts.scriptPath.empty())
        return runScript(engine, opts.scriptPath);

    runInteractive(engine);
    return 0;
}
