#include "io/fasta_reader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>

namespace ednakmer {

static void finish_record(std::vector<FastaRecord>& records, bool& in_record,
                          FastaRecord& cur) {
    if (in_record) {
        records.push_back(std::move(cur));
    }
    cur = FastaRecord();
    in_record = false;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<FastaRecord> read_fasta_stream(std::istream& in) {
    std::vector<FastaRecord> records;
    std::string line;
    FastaRecord cur;
    bool in_record = false;

    while (std::getline(in, line)) {
        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.empty())
            continue;

        if (line[0] == '>') {
            finish_record(records, in_record, cur);
            in_record = true;
            size_t start = 1;
            while (start < line.size() && is_space(line[start]))
                start++;
            size_t end = start;
            while (end < line.size() && !is_space(line[end]))
                end++;
            cur.id = line.substr(start, end - start);

            size_t desc = end;
            while (desc < line.size() && is_space(line[desc]))
                desc++;
            size_t desc_end = line.size();
            while (desc_end > desc && is_space(line[desc_end - 1]))
                desc_end--;
            cur.description = line.substr(desc, desc_end - desc);
        } else if (line[0] == ';') {
            // Comment line, skip
            continue;
        } else if (in_record) {
            cur.sequence += line;
        }
    }

    finish_record(records, in_record, cur);
    return records;
}

bool read_fasta(const std::string& path, std::vector<FastaRecord>& records,
                std::string& error_msg) {
    if (path == "-") {
        records = read_fasta_stream(std::cin);
        return true;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    records = read_fasta_stream(file);
    return true;
}

bool read_reference_fasta(const std::string& path,
                          std::vector<ReferenceRecord>& corpus,
                          std::string& error_msg) {
    std::vector<FastaRecord> records;
    if (!read_fasta(path, records, error_msg)) {
        return false;
    }
    corpus.clear();
    corpus.reserve(records.size());
    for (auto& rec : records) {
        if (rec.id.empty()) continue;
        corpus.push_back({std::move(rec.id), std::move(rec.sequence)});
    }
    return true;
}

} // namespace ednakmer
