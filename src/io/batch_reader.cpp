#include "io/batch_reader.hpp"
#include "io/fasta_reader.hpp"

#include <fstream>
#include <utility>

#include <json/json.h>

namespace ednakmer {

static std::string string_member(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key)) return {};
    const Json::Value& v = obj[key];
    if (v.isString()) return v.asString();
    if (v.isNumeric()) return v.asString();
    return {};
}

static bool parse_item(const Json::Value& item, size_t index,
                       BatchQuery& query, std::string& error_msg) {
    if (item.isString()) {
        query.id = default_query_id(index);
        query.sequence = item.asString();
        return true;
    }
    if (!item.isObject()) {
        error_msg = "batch item " + std::to_string(index + 1) +
                    " is neither a string nor an object";
        return false;
    }

    query.id = string_member(item, "test_id");
    if (query.id.empty()) query.id = string_member(item, "id");
    if (query.id.empty()) query.id = default_query_id(index);

    query.sequence = string_member(item, "sequence");
    query.description = string_member(item, "description");

    std::string expected = string_member(item, "expected_match");
    if (!expected.empty()) query.expected_species = std::move(expected);

    if (item.isMember("metadata")) query.metadata = item["metadata"];
    return true;
}

bool read_batch_json_stream(std::istream& in, std::vector<BatchQuery>& queries,
                            std::string& error_msg) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        error_msg = "invalid JSON: " + errs;
        return false;
    }

    const Json::Value* items = nullptr;
    if (root.isArray()) {
        items = &root;
    } else if (root.isObject() && root["test_sequences"].isArray()) {
        items = &root["test_sequences"];
    } else if (root.isObject() && root["sequences"].isArray()) {
        items = &root["sequences"];
    } else {
        error_msg = "expected an array or an object with a "
                    "'test_sequences' or 'sequences' array";
        return false;
    }

    queries.clear();
    queries.reserve(items->size());
    for (Json::ArrayIndex i = 0; i < items->size(); i++) {
        BatchQuery q;
        if (!parse_item((*items)[i], i, q, error_msg)) {
            return false;
        }
        queries.push_back(std::move(q));
    }
    return true;
}

bool read_batch_json(const std::string& path, std::vector<BatchQuery>& queries,
                     std::string& error_msg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    return read_batch_json_stream(file, queries, error_msg);
}

bool read_batch_fasta(const std::string& path, std::vector<BatchQuery>& queries,
                      std::string& error_msg) {
    std::vector<FastaRecord> records;
    if (!read_fasta(path, records, error_msg)) {
        return false;
    }
    queries.clear();
    queries.reserve(records.size());
    for (size_t i = 0; i < records.size(); i++) {
        BatchQuery q;
        q.id = records[i].id.empty() ? default_query_id(i) : std::move(records[i].id);
        q.description = std::move(records[i].description);
        q.sequence = std::move(records[i].sequence);
        queries.push_back(std::move(q));
    }
    return true;
}

} // namespace ednakmer
