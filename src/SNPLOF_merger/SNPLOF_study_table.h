#ifndef SNPLOF_STUDY_TABLE_H
#define SNPLOF_STUDY_TABLE_H

#include "snplof_core.h"
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Identifies one variant-allele-consequence-gene combination. Used as the
// join key across studies.
struct VariantKey {
    std::string snpId;
    std::string allele;
    std::string consequence;
    std::string geneId;
    std::string geneSymbol;

    bool operator==(const VariantKey &other) const {
        return snpId == other.snpId && allele == other.allele && consequence == other.consequence &&
               geneId == other.geneId && geneSymbol == other.geneSymbol;
    }

    // Key fields joined with tabs, as they appear in the first output columns
    std::string toString() const;
};

// Custom hash function for VariantKey using a hash-combine approach
struct VariantKeyHash {
    std::size_t operator()(const VariantKey &k) const {
        std::hash<std::string> h;
        std::size_t seed = h(k.snpId);
        seed ^= h(k.allele) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(k.consequence) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(k.geneId) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(k.geneSymbol) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

// Counts recomputed from one row's per-sample genotype columns
struct VariantRecord {
    long hetCount = 0;
    long homCount = 0;
    long totalSamples = 0;
    // Per-sample fields re-joined with tabs, written out verbatim
    std::string genotypes;
};

// Non-fatal problem found while reading a table
struct ParseWarning {
    std::string source;
    size_t lineNumber = 0;
    std::string message;

    std::string toString() const;
};

// One study's parsed input file
class StudyTable {
  public:
    StudyTable() = default;
    explicit StudyTable(std::string source) : source_(std::move(source)) {}

    const std::string &source() const { return source_; }
    const std::vector<std::string> &samples() const { return samples_; }
    size_t sampleCount() const { return samples_.size(); }

    // Keys in order of first appearance in the file
    const std::vector<VariantKey> &keys() const { return order_; }
    size_t size() const { return order_.size(); }
    bool contains(const VariantKey &key) const { return records_.count(key) > 0; }

    // Returns nullptr if the study has no row for the key
    const VariantRecord *find(const VariantKey &key) const;

    const std::vector<ParseWarning> &warnings() const { return warnings_; }

    void setSamples(std::vector<std::string> samples) { samples_ = std::move(samples); }

    // Stores a row. A key that is already present keeps its position but
    // takes the new record. Returns false in that case.
    bool insert(VariantKey key, VariantRecord record);

    void addWarning(size_t lineNumber, const std::string &message);

  private:
    std::string source_;
    std::vector<std::string> samples_;
    std::unordered_map<VariantKey, VariantRecord, VariantKeyHash> records_;
    std::vector<VariantKey> order_;
    std::vector<ParseWarning> warnings_;
};

// Genotype code (0, 1 or 2) of a token compared numerically, so "1" and
// "1.0" are both heterozygous. Hexadecimal and any other token yields -1.
int genotypeCode(const std::string &token);

// Splits a header line and returns the sample names after the fixed columns
std::vector<std::string> parseSampleHeader(const std::string &headerLine);

// Parses one data line into key and record. Returns false, with a message
// in 'problem', when the line has fewer than the fixed columns; key and
// record are still filled on a best-effort basis.
bool parseDataLine(const std::string &line, VariantKey &key, VariantRecord &record, std::string &problem);

// Reads a whole table (header then data lines). Malformed lines become
// warnings on the returned table; only an unreadable or corrupt stream
// throws InputError.
StudyTable readStudyTable(snplof::LineReader &reader, const std::string &source);
StudyTable readStudyTable(std::istream &in, const std::string &source);

// Opens and reads a table from disk (plain text or gzip)
StudyTable readStudyTableFile(const std::string &path);

// Keys present in every table, in the first table's order. Throws
// InputError if fewer than two tables are given.
std::vector<VariantKey> intersectKeys(const std::vector<StudyTable> &tables);

// Keys present in any table, each once, in order of first appearance.
// Throws InputError if fewer than two tables are given.
std::vector<VariantKey> unionKeys(const std::vector<StudyTable> &tables);

#endif // SNPLOF_STUDY_TABLE_H
