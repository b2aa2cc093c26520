#ifndef SNPLOF_CORE_H
#define SNPLOF_CORE_H

#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace snplof {

// Trim leading and trailing whitespace from a string
std::string trim(const std::string &str);

// Split a string on the given delimiter. Empty fields are kept, so
// "a,,b" yields three entries and "" yields one empty entry.
std::vector<std::string> split(const std::string &str, char delimiter);

// Join strings with the given delimiter
std::string join(const std::vector<std::string> &parts, char delimiter);

// Convenience helpers for printing common messages
void print_error(const std::string &msg, std::ostream &os = std::cerr);
void print_warning(const std::string &msg, std::ostream &os = std::cerr);
void print_version(const std::string &tool, const std::string &version, std::ostream &os = std::cout);

inline std::string get_version() {
#ifdef SNPLOF_VERSION
    return SNPLOF_VERSION;
#else
    return "unknown";
#endif
}

inline bool handle_version_flag(int argc, char *argv[], const std::string &tool, std::ostream &os = std::cout) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--version") == 0 || std::strcmp(argv[i], "-v") == 0) {
            print_version(tool, get_version(), os);
            return true;
        }
    }
    return false;
}

// Check if a specific flag (long or short form) is present
bool flag_present(int argc, char *argv[], const char *long_flag, const char *short_flag = nullptr);

// Handle the --help flag using the provided callback. Returns true if the flag
// was found and handled.
inline bool handle_help_flag(int argc, char *argv[], void (*print_help)()) {
    if (flag_present(argc, argv, "--help", "-h")) {
        if (print_help)
            print_help();
        return true;
    }
    return false;
}

// Handle both --help and --version flags. Returns true if either flag was found
// and processed (in which case the caller should exit).
inline bool handle_common_flags(int argc, char *argv[], const std::string &tool, void (*print_help)(),
                                std::ostream &os = std::cout) {
    if (handle_help_flag(argc, argv, print_help))
        return true;
    return handle_version_flag(argc, argv, tool, os);
}

// ------------------------------------------------------------
// Fatal error categories
// ------------------------------------------------------------
// Invalid option combination (too few inputs, no output path, refusing to
// overwrite an existing output).
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Unusable input (missing or unreadable file, too few tables to combine).
class InputError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// File system helpers
bool is_regular_file(const std::string &path);
bool path_exists(const std::string &path);

// ------------------------------------------------------------
// LineReader: line-by-line reading of plain or gzip/BGZF text
// ------------------------------------------------------------
// Compression is detected from the gzip magic bytes on the first read, so
// the same reader serves plain and compressed tables. Line terminators
// ("\n" or "\r\n") are stripped. Concatenated gzip members (BGZF) are
// decoded back to back.
//
// Usage:
//   std::ifstream file("study1.tsv.gz", std::ios::binary);
//   snplof::LineReader reader(file);
//   std::string line;
//   while (reader.getline(line)) {
//       // process line
//   }
//   if (reader.error()) { ... }
//
class LineReader {
  public:
    explicit LineReader(std::istream &in);
    ~LineReader();

    LineReader(const LineReader &) = delete;
    LineReader &operator=(const LineReader &) = delete;

    // Read the next line (without terminator). Returns false on EOF or error.
    bool getline(std::string &line);

    bool error() const { return error_; }
    bool is_compressed() const { return compressed_; }

  private:
    static constexpr size_t CHUNK_SIZE = 65536;

    struct Inflater;

    // Append more decoded text to pending_. Returns false when nothing more
    // can be produced (EOF or error).
    bool fill();
    bool fillCompressed();
    bool fillPlain();
    void detectCompression();

    std::istream &in_;
    std::unique_ptr<Inflater> inflater_;
    std::vector<char> inBuf_;
    std::vector<char> outBuf_;
    std::string pending_;
    size_t pendingPos_ = 0;
    bool detected_ = false;
    bool compressed_ = false;
    bool eof_ = false;
    bool error_ = false;
};

} // namespace snplof

#endif // SNPLOF_CORE_H
