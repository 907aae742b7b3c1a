#include "io/taxonomy_reader.hpp"

#include <cctype>
#include <fstream>
#include <optional>
#include <utility>
#include <vector>

namespace ednakmer {

namespace {

enum class Column {
    kIgnored, kSpeciesId, kScientificName, kCommonName, kPhylum,
    kKingdom, kClass, kOrder, kFamily, kGenus
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    return s.substr(start, end - start);
}

std::string lower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, tab - start)));
        start = tab + 1;
    }
    return fields;
}

Column column_for(const std::string& name) {
    std::string n = lower(name);
    if (n == "species_id") return Column::kSpeciesId;
    if (n == "scientific_name" || n == "species") return Column::kScientificName;
    if (n == "common_name") return Column::kCommonName;
    if (n == "phylum") return Column::kPhylum;
    if (n == "kingdom") return Column::kKingdom;
    if (n == "class") return Column::kClass;
    if (n == "order") return Column::kOrder;
    if (n == "family") return Column::kFamily;
    if (n == "genus") return Column::kGenus;
    return Column::kIgnored;
}

void set_optional(std::optional<std::string>& field, const std::string& value) {
    if (!value.empty()) field = value;
}

} // namespace

bool read_taxonomy_stream(std::istream& in, MetadataTable& table,
                          std::string& error_msg) {
    std::vector<Column> columns;
    bool have_header = false;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty() || line[0] == '#')
            continue;

        std::vector<std::string> fields = split_tabs(line);

        if (!have_header) {
            bool has_id = false;
            for (const auto& f : fields) {
                Column c = column_for(f);
                // Only the first scientific name column counts
                // (a table may carry both scientific_name and species).
                for (Column seen : columns) {
                    if (seen == c && c != Column::kIgnored) {
                        c = Column::kIgnored;
                        break;
                    }
                }
                if (c == Column::kSpeciesId) has_id = true;
                columns.push_back(c);
            }
            if (!has_id) {
                error_msg = "taxonomy header (line " + std::to_string(line_no) +
                            ") has no species_id column";
                return false;
            }
            have_header = true;
            continue;
        }

        SpeciesMetadata md;
        for (size_t i = 0; i < fields.size() && i < columns.size(); i++) {
            const std::string& v = fields[i];
            switch (columns[i]) {
                case Column::kSpeciesId:      md.species_id = v; break;
                case Column::kScientificName: md.scientific_name = v; break;
                case Column::kCommonName:     md.common_name = v; break;
                case Column::kPhylum:         md.phylum = v; break;
                case Column::kKingdom:        set_optional(md.kingdom, v); break;
                case Column::kClass:          set_optional(md.class_name, v); break;
                case Column::kOrder:          set_optional(md.order, v); break;
                case Column::kFamily:         set_optional(md.family, v); break;
                case Column::kGenus:          set_optional(md.genus, v); break;
                case Column::kIgnored:        break;
            }
        }
        if (md.species_id.empty()) continue;
        table.insert(std::move(md));
    }

    if (!have_header) {
        error_msg = "taxonomy table is empty (no header line)";
        return false;
    }
    return true;
}

bool read_taxonomy(const std::string& path, MetadataTable& table,
                   std::string& error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    return read_taxonomy_stream(file, table, error_msg);
}

} // namespace ednakmer
