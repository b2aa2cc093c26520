#include "SNPLOF_merger.h"
#include "snplof_core.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <getopt.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

static const char *const FIXED_COLUMNS[] = {"SNP_ID",
                                            "Allele",
                                            "Consequence",
                                            "gene_ID",
                                            "gene_symbol",
                                            "heterozygous_LoF_frequency",
                                            "homozygous_LoF_frequency",
                                            "heterozygous_LoF_carriers",
                                            "homozygous_LoF_carriers"};

std::string formatFrequency(long numerator, long denominator) {
    if (denominator == 0)
        return "NA";
    if (numerator == 0)
        return "0";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", static_cast<double>(numerator) / static_cast<double>(denominator));
    return buf;
}

std::string wingBlock(const std::string &wingValue, size_t sampleCount) {
    std::string block;
    if (sampleCount == 0)
        return block;
    block.reserve(sampleCount * (wingValue.size() + 1));
    block += wingValue;
    for (size_t i = 1; i < sampleCount; ++i) {
        block += '\t';
        block += wingValue;
    }
    return block;
}

MergedVariant mergeVariant(const VariantKey &key, const std::vector<StudyTable> &tables, MergeMode mode,
                           const std::string &wingValue) {
    MergedVariant merged;
    merged.key = key;

    for (size_t i = 0; i < tables.size(); ++i) {
        const StudyTable &study = tables[i];
        const VariantRecord *record = study.find(key);

        // The denominator counts the whole cohort, carriers or not
        merged.totalSamples += static_cast<long>(study.sampleCount());
        if (i > 0)
            merged.genotypes += '\t';

        if (record) {
            merged.hetCount += record->hetCount;
            merged.homCount += record->homCount;
            merged.genotypes += record->genotypes;
        } else if (mode == MergeMode::Union) {
            merged.genotypes += wingBlock(wingValue, study.sampleCount());
        } else {
            throw std::logic_error("variant " + key.toString() + " selected for intersection is missing from " +
                                   study.source());
        }
    }
    return merged;
}

void writeMergedHeader(std::ostream &out, const std::vector<StudyTable> &tables) {
    bool first = true;
    for (const char *column : FIXED_COLUMNS) {
        if (!first)
            out << '\t';
        out << column;
        first = false;
    }
    for (const auto &table : tables) {
        out << '\t' << snplof::join(table.samples(), '\t');
    }
    out << '\n';
}

void writeMergedRow(std::ostream &out, const MergedVariant &row) {
    out << row.key.toString() << '\t' << formatFrequency(row.hetCount, row.totalSamples) << '\t'
        << formatFrequency(row.homCount, row.totalSamples) << '\t' << row.hetCount << '\t' << row.homCount << '\t'
        << row.genotypes << '\n';
}

size_t mergeStudies(const std::vector<StudyTable> &tables, const MergeOptions &options, std::ostream &out) {
    std::vector<VariantKey> keys =
        options.mode == MergeMode::Union ? unionKeys(tables) : intersectKeys(tables);

    writeMergedHeader(out, tables);
    for (const auto &key : keys) {
        MergedVariant row = mergeVariant(key, tables, options.mode, options.wingValue);
        if (row.totalSamples == 0 && !options.quiet) {
            snplof::print_warning("no samples in any study for " + key.toString() + ", frequencies reported as NA");
        }
        writeMergedRow(out, row);
    }
    return keys.size();
}

static void addInputList(const std::string &list, std::vector<std::string> &files) {
    for (auto &name : snplof::split(list, ',')) {
        name = snplof::trim(name);
        if (!name.empty())
            files.push_back(name);
    }
}

bool parseArguments(int argc, char *argv[], MergeOptions &options) {
    static struct option long_options[] = {{"input-files", required_argument, 0, 'i'},
                                           {"input_files", required_argument, 0, 'i'},
                                           {"output-file", required_argument, 0, 'o'},
                                           {"output_file", required_argument, 0, 'o'},
                                           {"union", no_argument, 0, 'u'},
                                           {"wing-value", required_argument, 0, 'w'},
                                           {"wing_value", required_argument, 0, 'w'},
                                           {"clobber", no_argument, 0, 'c'},
                                           {"quiet", no_argument, 0, 'q'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    // Reset getopt (0 makes glibc reinitialise its scanning state)
    optind = 0;

    bool ok = true;
    int opt;
    while ((opt = getopt_long(argc, argv, "i:o:uw:cqh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'i':
            addInputList(optarg, options.inputFiles);
            break;
        case 'o':
            options.outputFile = optarg;
            break;
        case 'u':
            options.mode = MergeMode::Union;
            break;
        case 'w':
            options.wingValue = optarg;
            break;
        case 'c':
            options.clobber = true;
            break;
        case 'q':
            options.quiet = true;
            break;
        case 'h':
            options.showHelp = true;
            break;
        default:
            ok = false;
        }
    }

    // Remaining positional arguments are further input files
    for (int i = optind; i < argc; ++i) {
        addInputList(argv[i], options.inputFiles);
    }
    return ok;
}

void validateOptions(const MergeOptions &options) {
    if (options.inputFiles.size() < 2) {
        throw snplof::ConfigError("need at least two input files to merge, received " +
                                  std::to_string(options.inputFiles.size()));
    }
    if (options.outputFile.empty()) {
        throw snplof::ConfigError("need an output file to write to (-o)");
    }
    if (snplof::path_exists(options.outputFile) && !options.clobber) {
        throw snplof::ConfigError("not clobbering existing output file " + options.outputFile +
                                  " (use --clobber to overwrite)");
    }
    for (const auto &path : options.inputFiles) {
        if (!snplof::is_regular_file(path))
            throw snplof::InputError("invalid input file: " + path);
    }
}

void SNPLOFMerger::displayHelp() {
    std::cout << "SNPLOF_merger: Merge SNP LoF counts tables from multiple studies for mega-analysis.\n\n"
              << "Usage:\n"
              << "  SNPLOF_merger -i study1.tsv,study2.tsv[,...] -o merged.tsv [options]\n\n"
              << "Options:\n"
              << "  -i, --input-files LIST  Comma-separated list of input tables to merge (at least two).\n"
              << "                          Extra file arguments after the options are added to the list.\n"
              << "  -o, --output-file FILE  Output file to write the merged table to. Required.\n"
              << "  -u, --union             Keep variants seen in any study instead of only those\n"
              << "                          present in every study.\n"
              << "  -w, --wing-value STR    Genotype written for studies lacking a variant in\n"
              << "                          --union mode (default: 0).\n"
              << "  -c, --clobber           Overwrite the output file if it exists.\n"
              << "  -q, --quiet             Suppress warnings about malformed input lines.\n"
              << "  -v, --version           Print the version and exit.\n"
              << "  -h, --help              Display this help message and exit.\n\n"
              << "Description:\n"
              << "  Each input is a tab-separated table whose first nine columns are SNP_ID, Allele,\n"
              << "  Consequence, gene_ID, gene_symbol and four precomputed frequency/carrier columns,\n"
              << "  followed by one genotype column per sample (0 = non-carrier, 1 = heterozygous\n"
              << "  LoF, 2 = homozygous LoF). Inputs may be gzip or BGZF compressed.\n\n"
              << "  Carrier counts and frequencies are recomputed from the genotype columns; the\n"
              << "  precomputed columns are ignored. Frequencies use the combined sample count of\n"
              << "  all studies as denominator. Genotype columns are concatenated in input order.\n\n"
              << "Examples:\n"
              << "  SNPLOF_merger -i cohortA.tsv,cohortB.tsv -o merged.tsv\n"
              << "  SNPLOF_merger -i cohortA.tsv.gz,cohortB.tsv.gz,cohortC.tsv.gz -o merged.tsv --union -w NA\n";
}

std::vector<StudyTable> SNPLOFMerger::readInputs(const MergeOptions &options) {
    std::vector<StudyTable> tables;
    tables.reserve(options.inputFiles.size());
    for (const auto &path : options.inputFiles) {
        tables.push_back(readStudyTableFile(path));
        if (!options.quiet) {
            for (const auto &warning : tables.back().warnings()) {
                snplof::print_warning(warning.toString());
            }
        }
    }
    return tables;
}

size_t SNPLOFMerger::writeOutput(const std::vector<StudyTable> &tables, const MergeOptions &options) {
    // Staging file gets a fresh name beside the output so nothing already on
    // disk is ever truncated or removed
    std::string tmpTemplate = options.outputFile + ".XXXXXX";
    int fd = ::mkstemp(&tmpTemplate[0]);
    if (fd < 0) {
        throw std::runtime_error("cannot create staging file for " + options.outputFile + ": " +
                                 std::strerror(errno));
    }
    const std::string tmpPath = tmpTemplate;

    // mkstemp creates the file 0600; give the output the usual umask-based mode
    mode_t mask = ::umask(0);
    ::umask(mask);
    ::fchmod(fd, 0666 & ~mask);
    ::close(fd);

    size_t rows = 0;
    std::ofstream out;
    try {
        out.open(tmpPath, std::ios::trunc);
        if (!out.is_open())
            throw std::runtime_error("cannot open staging file " + tmpPath);
        rows = mergeStudies(tables, options, out);
        out.close();
        if (out.fail())
            throw std::runtime_error("failed writing output file " + tmpPath);
        if (std::rename(tmpPath.c_str(), options.outputFile.c_str()) != 0)
            throw std::runtime_error("cannot move " + tmpPath + " to " + options.outputFile);
    } catch (...) {
        if (out.is_open())
            out.close();
        std::remove(tmpPath.c_str());
        throw;
    }
    return rows;
}

int SNPLOFMerger::run(int argc, char *argv[]) {
    MergeOptions options;
    bool ok = parseArguments(argc, argv, options);

    if (options.showHelp) {
        displayHelp();
        return 0;
    }
    if (!ok) {
        snplof::print_error("invalid arguments, see --help for usage");
        return 1;
    }

    try {
        validateOptions(options);
        std::vector<StudyTable> tables = readInputs(options);
        size_t rows = writeOutput(tables, options);
        if (!options.quiet) {
            std::cerr << "Merged " << rows << " variants from " << tables.size() << " studies ("
                      << (options.mode == MergeMode::Union ? "union" : "intersection") << ") into "
                      << options.outputFile << "\n";
        }
    } catch (const snplof::ConfigError &e) {
        snplof::print_error(e.what());
        return 1;
    } catch (const snplof::InputError &e) {
        snplof::print_error(e.what());
        return 1;
    } catch (const std::logic_error &e) {
        snplof::print_error(std::string("internal error: ") + e.what());
        return 1;
    } catch (const std::runtime_error &e) {
        snplof::print_error(e.what());
        return 1;
    }
    return 0;
}
