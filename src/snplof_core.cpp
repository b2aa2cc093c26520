#include "snplof_core.h"
#include <cstring>
#include <sys/stat.h>
#include <zlib.h>

namespace snplof {

std::string trim(const std::string &str) {
    auto first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string &str, char delimiter) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t end;
    while ((end = str.find(delimiter, start)) != std::string::npos) {
        result.emplace_back(str, start, end - start);
        start = end + 1;
    }
    result.emplace_back(str, start);
    return result;
}

std::string join(const std::vector<std::string> &parts, char delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out.push_back(delimiter);
        out += parts[i];
    }
    return out;
}

bool flag_present(int argc, char *argv[], const char *long_flag, const char *short_flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], long_flag) == 0 || (short_flag && std::strcmp(argv[i], short_flag) == 0)) {
            return true;
        }
    }
    return false;
}

void print_error(const std::string &msg, std::ostream &os) { os << "Error: " << msg << '\n'; }

void print_warning(const std::string &msg, std::ostream &os) { os << "Warning: " << msg << '\n'; }

void print_version(const std::string &tool, const std::string &version, std::ostream &os) {
    os << tool << " version " << version << '\n';
}

bool is_regular_file(const std::string &path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
        return false;
    return S_ISREG(st.st_mode);
}

bool path_exists(const std::string &path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

// ------------------------------------------------------------
// LineReader Implementation
// ------------------------------------------------------------

struct LineReader::Inflater {
    z_stream strm;
    // Output buffer was filled completely by the last inflate() call, so
    // zlib may still hold decoded bytes for the current input.
    bool flushPending = false;
    // A gzip member has been started but its trailer not yet seen.
    bool inMember = false;
};

LineReader::LineReader(std::istream &in) : in_(in), inBuf_(CHUNK_SIZE), outBuf_(CHUNK_SIZE) {}

LineReader::~LineReader() {
    if (inflater_) {
        inflateEnd(&inflater_->strm);
    }
}

void LineReader::detectCompression() {
    detected_ = true;

    in_.read(inBuf_.data(), static_cast<std::streamsize>(inBuf_.size()));
    std::streamsize got = in_.gcount();
    if (in_.bad()) {
        error_ = true;
        return;
    }
    if (got <= 0) {
        eof_ = true;
        return;
    }

    compressed_ = got >= 2 && static_cast<unsigned char>(inBuf_[0]) == 0x1f &&
                  static_cast<unsigned char>(inBuf_[1]) == 0x8b;
    if (!compressed_) {
        pending_.append(inBuf_.data(), static_cast<size_t>(got));
        return;
    }

    auto inflater = std::make_unique<Inflater>();
    std::memset(&inflater->strm, 0, sizeof(z_stream));
    // 15 + 32 enables gzip decoding with automatic header detection
    if (inflateInit2(&inflater->strm, 15 + 32) != Z_OK) {
        error_ = true;
        return;
    }
    inflater->strm.next_in = reinterpret_cast<Bytef *>(inBuf_.data());
    inflater->strm.avail_in = static_cast<uInt>(got);
    inflater_ = std::move(inflater);
}

bool LineReader::fillPlain() {
    in_.read(outBuf_.data(), static_cast<std::streamsize>(outBuf_.size()));
    std::streamsize got = in_.gcount();
    if (in_.bad()) {
        error_ = true;
        return false;
    }
    if (got <= 0) {
        eof_ = true;
        return false;
    }
    pending_.append(outBuf_.data(), static_cast<size_t>(got));
    return true;
}

bool LineReader::fillCompressed() {
    z_stream &strm = inflater_->strm;

    while (true) {
        if (strm.avail_in == 0 && !inflater_->flushPending) {
            in_.read(inBuf_.data(), static_cast<std::streamsize>(inBuf_.size()));
            std::streamsize got = in_.gcount();
            if (in_.bad()) {
                error_ = true;
                return false;
            }
            if (got <= 0) {
                // Input ended inside a member: truncated archive
                if (inflater_->inMember)
                    error_ = true;
                eof_ = true;
                return false;
            }
            strm.next_in = reinterpret_cast<Bytef *>(inBuf_.data());
            strm.avail_in = static_cast<uInt>(got);
        }

        strm.next_out = reinterpret_cast<Bytef *>(outBuf_.data());
        strm.avail_out = static_cast<uInt>(outBuf_.size());

        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            error_ = true;
            return false;
        }

        size_t have = outBuf_.size() - strm.avail_out;
        inflater_->flushPending = (strm.avail_out == 0);
        inflater_->inMember = true;

        if (ret == Z_STREAM_END) {
            // BGZF and concatenated gzip: continue with the next member
            inflater_->inMember = false;
            inflater_->flushPending = false;
            inflateReset(&strm);
        }

        if (have > 0) {
            pending_.append(outBuf_.data(), have);
            return true;
        }
    }
}

bool LineReader::fill() {
    if (eof_ || error_)
        return false;
    if (compressed_)
        return fillCompressed();
    return fillPlain();
}

bool LineReader::getline(std::string &line) {
    line.clear();

    if (!detected_)
        detectCompression();

    while (true) {
        size_t newlinePos = pending_.find('\n', pendingPos_);
        if (newlinePos != std::string::npos) {
            size_t end = newlinePos;
            if (end > pendingPos_ && pending_[end - 1] == '\r')
                --end;
            line.assign(pending_, pendingPos_, end - pendingPos_);
            pendingPos_ = newlinePos + 1;

            // Drop consumed text once it dominates the buffer
            if (pendingPos_ > pending_.size() / 2) {
                pending_.erase(0, pendingPos_);
                pendingPos_ = 0;
            }
            return true;
        }

        if (!fill()) {
            if (error_)
                return false;
            // Last line without a terminator
            if (pendingPos_ < pending_.size()) {
                line.assign(pending_, pendingPos_, std::string::npos);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                pending_.clear();
                pendingPos_ = 0;
                return true;
            }
            return false;
        }
    }
}

} // namespace snplof
