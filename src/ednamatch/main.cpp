#include "core/config.hpp"
#include "core/kmer_encoding.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "index/index_builder.hpp"
#include "index/species_metadata.hpp"
#include "io/batch_reader.hpp"
#include "io/fasta_reader.hpp"
#include "io/result_writer.hpp"
#include "io/taxonomy_reader.hpp"
#include "search/batch_runner.hpp"
#include "search/sequence_matcher.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace ednakmer;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s -ref <fasta> [mode] [options]\n"
        "\n"
        "Required:\n"
        "  -ref <path>              Reference FASTA (header first word = species_id)\n"
        "\n"
        "Mode (exactly one):\n"
        "  -sequence <seq>          Match a single sequence\n"
        "  -query <path>            Match every record of a FASTA file (- for stdin)\n"
        "  -batch <path>            Match a JSON test set and report accuracy\n"
        "  -interactive             Read sequences from stdin until 'quit'\n"
        "\n"
        "Options:\n"
        "  -taxonomy <path>         Species taxonomy table (TSV with header)\n"
        "  -k <int>                 k-mer length (default: %d)\n"
        "  -min_score <float>       Minimum matching score, 0-100 (default: %.1f)\n"
        "  -top_n <int>             Max matches per query (default: %d, max: %d)\n"
        "  -threads <int>           Batch matching threads (default: all cores)\n"
        "  -outfmt <tab|json>       Output format (default: tab)\n"
        "  -o <path>                Output file (default: stdout)\n"
        "  -v, --verbose            Verbose logging\n"
        "  --version                Print version\n",
        prog, DEFAULT_K, DEFAULT_MIN_SCORE, DEFAULT_TOP_N, MAX_TOP_N);
}

static bool write_output(const std::string& output_path, const BatchResult& result,
                         OutputFormat fmt) {
    if (output_path.empty()) {
        write_results(std::cout, result, fmt);
        return true;
    }
    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::fprintf(stderr, "Error: cannot open output file %s\n", output_path.c_str());
        return false;
    }
    write_results(out, result, fmt);
    return true;
}

static std::string lower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static void run_interactive(const SequenceMatcher& matcher, const MatchConfig& config) {
    std::cout << "Enter DNA sequences to match ('quit' to exit)\n";
    std::string line;
    size_t n = 0;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;

        std::string seq(trim_sequence(line));
        std::string cmd = lower(seq);
        if (cmd == "quit" || cmd == "exit" || cmd == "q") break;
        if (seq.empty()) continue;

        std::string err;
        if (!validate_query_bases(seq, err)) {
            std::cout << "Invalid sequence: " << err << '\n';
            continue;
        }

        std::vector<ScoredMatch> matches;
        if (!matcher.match(seq, config, matches, err)) {
            std::cout << "Error: " << err << '\n';
            continue;
        }
        n++;
        write_match_report(std::cout, "query " + std::to_string(n), seq.size(), matches);
    }
}

static void log_batch_summary(const BatchResult& result, const Logger& logger) {
    const BatchStats& st = result.stats;
    logger.info("Processed %zu sequence(s): %zu with matches, %zu failed "
                "(%zu errors), success rate %.1f%%",
                st.total, st.successful, st.failed, st.errors, st.success_rate());
    if (!st.has_accuracy()) return;

    for (size_t i = 0; i < result.items.size(); i++) {
        const auto& item = result.items[i];
        if (item.matches.empty()) {
            logger.debug("%s: no matches found", item.id.c_str());
        } else {
            logger.debug("%s: best match %s (%.2f%%)", item.id.c_str(),
                         item.matches.front().species_id.c_str(),
                         round_score(item.matches.front().matching_score));
        }
    }
    logger.info("Accuracy: %.1f%% (%zu/%zu)", st.accuracy(), st.correct,
                st.with_expectation);
    logger.info("Algorithm performance: %s",
                st.accuracy() >= 80.0 ? "good" : "needs improvement");
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "ednamatch")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (!cli.has("-ref")) {
        print_usage(argv[0]);
        return 1;
    }

    int modes = (cli.has("-sequence") ? 1 : 0) + (cli.has("-query") ? 1 : 0) +
                (cli.has("-batch") ? 1 : 0) + (cli.has("-interactive") ? 1 : 0);
    if (modes != 1) {
        std::fprintf(stderr, "Error: specify exactly one of -sequence, -query, "
                             "-batch, -interactive\n");
        return 1;
    }

    Logger logger = make_logger(cli, "ednamatch");

    int k = DEFAULT_K;
    MatchConfig match_config;
    std::string err;
    if (!load_match_options(cli, logger, k, match_config, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    OutputFormat outfmt = OutputFormat::kTab;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    std::string output_path = cli.get_string("-o");

    // Reference corpus and taxonomy
    std::vector<ReferenceRecord> corpus;
    if (!read_reference_fasta(cli.get_string("-ref"), corpus, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    logger.info("Read %zu reference sequence(s)", corpus.size());

    MetadataTable taxonomy;
    if (cli.has("-taxonomy")) {
        if (!read_taxonomy(cli.get_string("-taxonomy"), taxonomy, err)) {
            std::fprintf(stderr, "Error: %s\n", err.c_str());
            return 1;
        }
        logger.info("Read %zu taxonomy record(s)", taxonomy.size());
    }

    IndexBuilderConfig build_config;
    build_config.k = k;
    build_config.verbose = logger.verbose();
    ReferenceIndexPtr index = build_reference_index(
        corpus, taxonomy, build_config, logger.with_component("index"), err);
    if (!index) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    corpus.clear();
    if (index->empty()) {
        logger.warn("Reference index is empty; no query can match");
    }

    SequenceMatcher matcher(index);

    if (cli.has("-interactive")) {
        run_interactive(matcher, match_config);
        return 0;
    }

    std::vector<BatchQuery> queries;
    if (cli.has("-sequence")) {
        BatchQuery q;
        q.id = "query";
        q.sequence = cli.get_string("-sequence");
        if (!validate_query_bases(trim_sequence(q.sequence), err)) {
            std::fprintf(stderr, "Error: %s\n", err.c_str());
            return 1;
        }
        queries.push_back(std::move(q));
    } else if (cli.has("-query")) {
        if (!read_batch_fasta(cli.get_string("-query"), queries, err)) {
            std::fprintf(stderr, "Error: %s\n", err.c_str());
            return 1;
        }
    } else {
        if (!read_batch_json(cli.get_string("-batch"), queries, err)) {
            std::fprintf(stderr, "Error: %s\n", err.c_str());
            return 1;
        }
    }

    if (queries.empty()) {
        std::fprintf(stderr, "Error: no query sequences found\n");
        return 1;
    }
    if (queries.size() > MAX_BATCH_QUERIES) {
        logger.warn("%zu queries exceed the recommended batch size of %zu",
                    queries.size(), MAX_BATCH_QUERIES);
    }
    logger.info("Matching %zu query sequence(s)", queries.size());

    BatchConfig batch_config;
    batch_config.match = match_config;
    batch_config.threads = resolve_threads(cli);

    BatchResult result;
    if (!run_batch(matcher, queries, batch_config, result, logger, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    if (!write_output(output_path, result, outfmt)) {
        return 1;
    }
    log_batch_summary(result, logger);
    return 0;
}
