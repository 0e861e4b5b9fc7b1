// feedcraft.cpp – Command-line front end: print the items of RSS 2.0 files.
//
//   feedcraft parse <file>
//   feedcraft parse-dir <dir>

#include "FeedCraft/Parser.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace feedcraft;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open '" + path.string() + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Coarse pre-filter applied before handing a file to the parser.
static bool looksLikeRss(const std::string& content) {
    return content.find("<rss") != std::string::npos;
}

static const std::string& orNone(const std::optional<std::string>& v) {
    static const std::string none = "None";
    return v ? *v : none;
}

static void printItems(const RssFeed& feed) {
    std::cout << "Items:\n";
    for (const auto& item : feed.channel.items)
        std::cout << "- " << orNone(item.pub_date) << ": " << orNone(item.title) << '\n';
}

static int usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " parse <file>\n"
              << "       " << argv0 << " parse-dir <dir>\n";
    return 2;
}

// ─── Sub-commands ─────────────────────────────────────────────────────────────

static int cmdParse(const fs::path& path) {
    std::string content;
    try {
        content = readFile(path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    if (!looksLikeRss(content)) {
        std::cerr << "The provided file does not appear to be a valid RSS feed.\n";
        return 1;
    }

    try {
        RssFeed feed = parseRss(content);
        std::cout << "Feed Title: " << feed.channel.title << '\n';
        printItems(feed);
    } catch (const ParseError& e) {
        std::cerr << "Error parsing " << path.string() << ": " << e.what() << '\n';
        return 1;
    }
    return 0;
}

static int cmdParseDir(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc))
            files.push_back(it->path());
    }
    if (ec) {
        std::cerr << "Error: cannot read directory '" << dir.string() << "': " << ec.message() << '\n';
        return 1;
    }
    std::sort(files.begin(), files.end());

    for (size_t i = 0; i < files.size(); ++i) {
        const fs::path& file = files[i];
        const size_t    n    = i + 1;

        std::string content;
        try {
            content = readFile(file);
        } catch (const std::exception& e) {
            std::cerr << '[' << n << "] Error reading " << file.string() << ": " << e.what() << '\n';
            continue;
        }

        if (!looksLikeRss(content)) {
            std::cerr << '[' << n << "] " << file.filename().string() << ": not a valid RSS feed\n";
            continue;
        }

        try {
            RssFeed feed = parseRss(content);
            std::cout << "\n\n-------\n\n[" << n << "]\n"
                      << "Feed Title: " << feed.channel.title
                      << " (from " << file.filename().string() << ")\n";
            printItems(feed);
        } catch (const ParseError& e) {
            std::cerr << '[' << n << "] Error parsing " << file.string() << ": " << e.what() << '\n';
        }
    }
    return 0;
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    if (argc != 3)
        return usage(argv[0]);

    const std::string cmd = argv[1];
    if (cmd == "parse")     return cmdParse(argv[2]);
    if (cmd == "parse-dir") return cmdParseDir(argv[2]);
    return usage(argv[0]);
}
