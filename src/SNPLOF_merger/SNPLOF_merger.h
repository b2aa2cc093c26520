#ifndef SNPLOF_MERGER_H
#define SNPLOF_MERGER_H

#include "SNPLOF_study_table.h"
#include <iostream>
#include <string>
#include <vector>

// SNPLOF_merger: merges per-study SNP LoF counts tables for mega-analysis

enum class MergeMode { Intersection, Union };

struct MergeOptions {
    std::vector<std::string> inputFiles;
    std::string outputFile;
    MergeMode mode = MergeMode::Intersection;
    // Filler genotype for studies lacking a variant (union mode only)
    std::string wingValue = "0";
    bool clobber = false;
    bool quiet = false;
    bool showHelp = false;
};

// One output row: a variant's counts pooled over all studies
struct MergedVariant {
    VariantKey key;
    long hetCount = 0;
    long homCount = 0;
    // Sum of every study's sample count, including studies lacking the variant
    long totalSamples = 0;
    // Per-study genotype blocks joined with tabs, in study order
    std::string genotypes;
};

// Carrier frequency as written to the output: "NA" when the denominator is
// zero, "0" when the numerator is zero, otherwise the quotient with up to
// 15 significant digits.
std::string formatFrequency(long numerator, long denominator);

// The wing value repeated once per sample, tab-joined. Empty for zero samples.
std::string wingBlock(const std::string &wingValue, size_t sampleCount);

// Pools one variant over the studies. In intersection mode every study must
// hold the key (std::logic_error otherwise); in union mode a missing study
// contributes a wing block and zero carriers.
MergedVariant mergeVariant(const VariantKey &key, const std::vector<StudyTable> &tables, MergeMode mode,
                           const std::string &wingValue);

void writeMergedHeader(std::ostream &out, const std::vector<StudyTable> &tables);
void writeMergedRow(std::ostream &out, const MergedVariant &row);

// Writes header and all rows for the combined key set. Returns the number of
// variant rows written.
size_t mergeStudies(const std::vector<StudyTable> &tables, const MergeOptions &options, std::ostream &out);

// Parses the command line into 'options'. Returns false on an unrecognised
// option or a missing option argument.
bool parseArguments(int argc, char *argv[], MergeOptions &options);

// Throws ConfigError or InputError when the options cannot produce a merge
void validateOptions(const MergeOptions &options);

class SNPLOFMerger {
  public:
    // Entry point for the tool
    int run(int argc, char *argv[]);

  private:
    // Displays the help message
    void displayHelp();

    // Reads every input, reporting parse warnings unless quiet
    std::vector<StudyTable> readInputs(const MergeOptions &options);

    // Writes the merge to a uniquely named sibling (<output>.XXXXXX) and
    // renames it over the output path once complete
    size_t writeOutput(const std::vector<StudyTable> &tables, const MergeOptions &options);
};

#endif // SNPLOF_MERGER_H
