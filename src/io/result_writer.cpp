#include "io/result_writer.hpp"
#include "core/confidence.hpp"
#include "search/sequence_matcher.hpp"

#include <cctype>
#include <cstdio>

#include <json/json.h>

namespace ednakmer {

static std::string format_score(double score) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", round_score(score));
    return buf;
}

static std::string upper(const char* s) {
    std::string r(s);
    for (auto& c : r)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return r;
}

void write_results_tab(std::ostream& out, const BatchResult& result) {
    out << "# query_id\trank\tspecies_id\tscientific_name\tcommon_name\tphylum\t"
           "matching_score\tconfidence_level\tquery_length\tquery_kmer_count\n";
    for (const auto& item : result.items) {
        if (item.failed()) {
            out << "# " << item.id << ": " << item.error << '\n';
            continue;
        }
        for (size_t i = 0; i < item.matches.size(); i++) {
            const auto& m = item.matches[i];
            out << item.id << '\t'
                << (i + 1) << '\t'
                << m.species_id << '\t'
                << m.scientific_name << '\t'
                << m.common_name << '\t'
                << m.phylum << '\t'
                << format_score(m.matching_score) << '\t'
                << confidence_name(m.confidence_level) << '\t'
                << m.query_length << '\t'
                << m.query_kmer_count << '\n';
        }
    }
}

static void json_escape(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out << buf;
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
}

// Single-line rendering of caller-supplied metadata.
static std::string compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

static void write_match_json(std::ostream& out, const ScoredMatch& m) {
    out << "        {\n";
    out << "          \"species_id\": "; json_escape(out, m.species_id); out << ",\n";
    out << "          \"scientific_name\": "; json_escape(out, m.scientific_name); out << ",\n";
    out << "          \"common_name\": "; json_escape(out, m.common_name); out << ",\n";
    out << "          \"phylum\": "; json_escape(out, m.phylum); out << ",\n";
    out << "          \"taxonomy\": {\n";
    out << "            \"kingdom\": "; json_escape(out, m.taxonomy.kingdom); out << ",\n";
    out << "            \"phylum\": "; json_escape(out, m.phylum); out << ",\n";
    out << "            \"class\": "; json_escape(out, m.taxonomy.class_name); out << ",\n";
    out << "            \"order\": "; json_escape(out, m.taxonomy.order); out << ",\n";
    out << "            \"family\": "; json_escape(out, m.taxonomy.family); out << ",\n";
    out << "            \"genus\": "; json_escape(out, m.taxonomy.genus); out << "\n";
    out << "          },\n";
    out << "          \"matching_score\": " << format_score(m.matching_score) << ",\n";
    out << "          \"confidence_level\": \"" << confidence_name(m.confidence_level) << "\",\n";
    out << "          \"query_length\": " << m.query_length << ",\n";
    out << "          \"query_kmers\": " << m.query_kmer_count << "\n";
    out << "        }";
}

void write_results_json(std::ostream& out, const BatchResult& result) {
    out << "{\n  \"results\": [\n";
    for (size_t qi = 0; qi < result.items.size(); qi++) {
        const auto& item = result.items[qi];
        out << "    {\n      \"query_id\": ";
        json_escape(out, item.id);
        out << ",\n      \"sequence_length\": " << item.sequence_length << ",\n";
        if (item.failed()) {
            out << "      \"error\": ";
            json_escape(out, item.error);
            out << ",\n";
        }
        if (!item.metadata.isNull()) {
            out << "      \"metadata\": " << compact_json(item.metadata) << ",\n";
        }
        out << "      \"total_matches\": " << item.matches.size() << ",\n";
        out << "      \"matches\": [\n";
        for (size_t mi = 0; mi < item.matches.size(); mi++) {
            write_match_json(out, item.matches[mi]);
            if (mi + 1 < item.matches.size()) out << ',';
            out << '\n';
        }
        out << "      ]\n    }";
        if (qi + 1 < result.items.size()) out << ',';
        out << '\n';
    }
    out << "  ],\n";

    const BatchStats& st = result.stats;
    out << "  \"summary\": {\n";
    out << "    \"total_sequences\": " << st.total << ",\n";
    out << "    \"successful_matches\": " << st.successful << ",\n";
    out << "    \"failed_sequences\": " << st.failed << ",\n";
    out << "    \"error_sequences\": " << st.errors << ",\n";
    out << "    \"success_rate\": " << format_score(st.success_rate());
    if (st.has_accuracy()) {
        out << ",\n    \"with_expectation\": " << st.with_expectation << ",\n";
        out << "    \"correct\": " << st.correct << ",\n";
        out << "    \"accuracy\": " << format_score(st.accuracy());
    }
    out << "\n  }\n}\n";
}

void write_results(std::ostream& out, const BatchResult& result, OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::kTab:
            write_results_tab(out, result);
            break;
        case OutputFormat::kJson:
            write_results_json(out, result);
            break;
    }
}

void write_match_report(std::ostream& out, const std::string& query_label,
                        size_t query_length,
                        const std::vector<ScoredMatch>& matches) {
    out << "Matching results for " << query_label
        << " (length: " << query_length << ")\n";
    if (matches.empty()) {
        out << "  No matches found above threshold\n";
        return;
    }
    for (size_t i = 0; i < matches.size(); i++) {
        const auto& m = matches[i];
        out << "  " << (i + 1) << ". " << m.common_name
            << " (" << m.scientific_name << ") [" << m.species_id << "]\n"
            << "     Score: " << format_score(m.matching_score) << "% "
            << upper(confidence_name(m.confidence_level)) << '\n'
            << "     Phylum: " << m.phylum << '\n';
    }
}

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else {
        error_msg = "unknown output format '" + str + "'";
        return false;
    }
    return true;
}

} // namespace ednakmer
