#include "SNPLOF_study_table.h"
#include "snplof_io.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <unordered_set>

std::string VariantKey::toString() const {
    std::string out;
    out.reserve(snpId.size() + allele.size() + consequence.size() + geneId.size() + geneSymbol.size() + 4);
    out += snpId;
    out += '\t';
    out += allele;
    out += '\t';
    out += consequence;
    out += '\t';
    out += geneId;
    out += '\t';
    out += geneSymbol;
    return out;
}

std::string ParseWarning::toString() const {
    return source + ":" + std::to_string(lineNumber) + ": " + message;
}

const VariantRecord *StudyTable::find(const VariantKey &key) const {
    auto it = records_.find(key);
    if (it == records_.end())
        return nullptr;
    return &it->second;
}

bool StudyTable::insert(VariantKey key, VariantRecord record) {
    auto it = records_.find(key);
    if (it != records_.end()) {
        it->second = std::move(record);
        return false;
    }
    order_.push_back(key);
    records_.emplace(std::move(key), std::move(record));
    return true;
}

void StudyTable::addWarning(size_t lineNumber, const std::string &message) {
    warnings_.push_back(ParseWarning{source_, lineNumber, message});
}

int genotypeCode(const std::string &token) {
    // Decimal only: strtod would also take hex forms such as "0x1"
    if (token.empty() || token.find_first_of("xX") != std::string::npos)
        return -1;
    const char *begin = token.c_str();
    char *end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE)
        return -1;
    if (value == snplof::LOF::NON_CARRIER)
        return snplof::LOF::NON_CARRIER;
    if (value == snplof::LOF::HET_CARRIER)
        return snplof::LOF::HET_CARRIER;
    if (value == snplof::LOF::HOM_CARRIER)
        return snplof::LOF::HOM_CARRIER;
    return -1;
}

std::vector<std::string> parseSampleHeader(const std::string &headerLine) {
    std::vector<std::string> fields;
    snplof::split_tabs(headerLine, fields);
    if (fields.size() <= static_cast<size_t>(snplof::LOF::FIRST_SAMPLE))
        return {};
    return std::vector<std::string>(fields.begin() + snplof::LOF::FIRST_SAMPLE, fields.end());
}

bool parseDataLine(const std::string &line, VariantKey &key, VariantRecord &record, std::string &problem) {
    std::vector<std::string> fields;
    snplof::split_tabs(line, fields, 64);

    bool complete = fields.size() >= static_cast<size_t>(snplof::LOF::MIN_FIELDS);
    if (!complete) {
        problem = "expected at least " + std::to_string(snplof::LOF::MIN_FIELDS) + " tab-separated fields, found " +
                  std::to_string(fields.size());
    }

    // Best effort: missing key columns are left empty
    fields.resize(std::max(fields.size(), static_cast<size_t>(snplof::LOF::KEY_FIELDS)));
    key.snpId = fields[snplof::LOF::SNP_ID];
    key.allele = fields[snplof::LOF::ALLELE];
    key.consequence = fields[snplof::LOF::CONSEQUENCE];
    key.geneId = fields[snplof::LOF::GENE_ID];
    key.geneSymbol = fields[snplof::LOF::GENE_SYMBOL];

    // Columns HET_FREQUENCY..HOM_CARRIERS are recomputed, never read
    record = VariantRecord();
    for (size_t i = snplof::LOF::FIRST_SAMPLE; i < fields.size(); ++i) {
        const std::string &token = fields[i];
        switch (genotypeCode(token)) {
        case snplof::LOF::HET_CARRIER:
            ++record.hetCount;
            break;
        case snplof::LOF::HOM_CARRIER:
            ++record.homCount;
            break;
        default:
            break;
        }
        if (record.totalSamples > 0)
            record.genotypes.push_back('\t');
        record.genotypes += token;
        ++record.totalSamples;
    }
    return complete;
}

StudyTable readStudyTable(snplof::LineReader &reader, const std::string &source) {
    StudyTable table(source);
    std::string line;
    line.reserve(4096);

    if (!reader.getline(line)) {
        if (reader.error())
            throw snplof::InputError("failed to read " + source + " (corrupt or unreadable input)");
        table.addWarning(0, "empty input, no header line");
        return table;
    }
    table.setSamples(parseSampleHeader(line));

    size_t lineNumber = 1;
    VariantKey key;
    VariantRecord record;
    std::string problem;
    while (reader.getline(line)) {
        ++lineNumber;
        if (!parseDataLine(line, key, record, problem)) {
            table.addWarning(lineNumber, problem);
        } else if (record.totalSamples != static_cast<long>(table.sampleCount())) {
            table.addWarning(lineNumber, "row has " + std::to_string(record.totalSamples) +
                                             " genotype columns but the header names " +
                                             std::to_string(table.sampleCount()) + " samples");
        }
        if (!table.insert(key, record)) {
            table.addWarning(lineNumber, "duplicate variant " + key.toString() + ", keeping the last occurrence");
        }
    }
    if (reader.error())
        throw snplof::InputError("failed to read " + source + " past line " + std::to_string(lineNumber) +
                                 " (corrupt or truncated input)");
    return table;
}

StudyTable readStudyTable(std::istream &in, const std::string &source) {
    snplof::LineReader reader(in);
    return readStudyTable(reader, source);
}

StudyTable readStudyTableFile(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw snplof::InputError("cannot open input file: " + path);
    return readStudyTable(file, path);
}

std::vector<VariantKey> intersectKeys(const std::vector<StudyTable> &tables) {
    if (tables.size() < 2)
        throw snplof::InputError("need at least two tables to intersect, received " + std::to_string(tables.size()));

    std::vector<VariantKey> result;
    for (const auto &key : tables.front().keys()) {
        bool everywhere = true;
        for (size_t t = 1; t < tables.size(); ++t) {
            if (!tables[t].contains(key)) {
                everywhere = false;
                break;
            }
        }
        if (everywhere)
            result.push_back(key);
    }
    return result;
}

std::vector<VariantKey> unionKeys(const std::vector<StudyTable> &tables) {
    if (tables.size() < 2)
        throw snplof::InputError("need at least two tables to unite, received " + std::to_string(tables.size()));

    std::vector<VariantKey> result;
    std::unordered_set<VariantKey, VariantKeyHash> seen;
    for (const auto &table : tables) {
        for (const auto &key : table.keys()) {
            if (seen.insert(key).second)
                result.push_back(key);
        }
    }
    return result;
}
