#include "tkgstats/processing/label_fetch.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include "tkgstats/sources/dataset_source.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace tkgstats {

namespace {

/// Percent-encode everything outside the RFC 3986 unreserved set
std::string url_encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += '|';
        }
        joined += id;
    }
    return joined;
}

} // namespace

bool LabelFetcher::is_entity_id(std::string_view token) {
    if (token.size() < 2 || token[0] != 'Q') {
        return false;
    }
    return std::all_of(token.begin() + 1, token.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

std::set<std::string> LabelFetcher::collect_entity_ids(const std::filesystem::path& dataset_dir,
                                                       const std::string& extension) {
    std::set<std::string> ids;
    std::vector<std::string_view> columns;

    for (const auto& path : DatasetSource::list_split_files(dataset_dir, extension)) {
        TripleReader reader(path);
        while (reader.next(columns)) {
            if (is_entity_id(columns[0])) {
                ids.emplace(columns[0]);
            }
            if (is_entity_id(columns[2])) {
                ids.emplace(columns[2]);
            }
        }
    }
    return ids;
}

std::vector<std::vector<std::string>> LabelFetcher::batched(const std::set<std::string>& ids,
                                                            size_t size) {
    const size_t chunk = std::max<size_t>(size, 1);
    std::vector<std::vector<std::string>> batches;

    for (const auto& id : ids) {
        if (batches.empty() || batches.back().size() == chunk) {
            batches.emplace_back();
            batches.back().reserve(chunk);
        }
        batches.back().push_back(id);
    }
    return batches;
}

std::string LabelFetcher::build_request_url(const std::vector<std::string>& ids,
                                            const LabelFetchOptions& opts) {
    return opts.api_url +
           "?action=wbgetentities&format=json&props=labels" +
           "&ids=" + url_encode(join_ids(ids)) +
           "&languages=" + url_encode(opts.language);
}

LabelMapping LabelFetcher::parse_labels(const std::string& response,
                                        const std::vector<std::string>& ids,
                                        const std::string& language) {
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(response);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("Malformed wbgetentities response (") + ex.what() + ")");
    }

    const nlohmann::json empty = nlohmann::json::object();
    auto member = [&](const nlohmann::json& node, const std::string& key) -> const nlohmann::json& {
        if (!node.is_object()) {
            return empty;
        }
        auto it = node.find(key);
        return it == node.end() ? empty : *it;
    };

    LabelMapping mapping;
    const nlohmann::json& entities = member(payload, "entities");
    for (const auto& id : ids) {
        const nlohmann::json& label = member(member(member(entities, id), "labels"), language);
        const nlohmann::json& value = member(label, "value");
        mapping[id] = value.is_string() ? value.get<std::string>() : std::string();
    }
    return mapping;
}

LabelMapping LabelFetcher::fetch_labels(const std::vector<std::string>& ids,
                                        const LabelFetchOptions& opts) {
    const std::string url = build_request_url(ids, opts);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::string body;
    bool success = true;
    success &= !curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    success &= !curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opts.user_agent.c_str());
    success &= !curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, opts.timeout_ms);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, opts.timeout_ms);
    success &= !curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
                                 +[](char *ptr, size_t, size_t nmemb, void *udata) {
        std::string *body = static_cast<std::string *>(udata);
        body->append(ptr, nmemb);
        return nmemb;
    });
    success &= !curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    if (!success) {
        throw std::runtime_error("Failed to set libcurl options");
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("Label request failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        throw std::runtime_error("Label request failed with HTTP status " + std::to_string(status));
    }

    return parse_labels(body, ids, opts.language);
}

LabelMapping LabelFetcher::build_mapping(const std::set<std::string>& ids,
                                         const LabelFetchOptions& opts) {
    LabelMapping mapping;
    mapping.reserve(ids.size());

    size_t fetched = 0;
    for (const auto& batch : batched(ids, opts.batch_size)) {
        if (fetched > 0 && opts.delay_seconds > 0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(opts.delay_seconds));
        }

        for (auto& [id, label] : fetch_labels(batch, opts)) {
            mapping[id] = std::move(label);
        }
        fetched += batch.size();
        std::cerr << "\r[LABELS] Fetched labels for " << fetched << " / " << ids.size()
                  << " entities" << std::flush;
    }
    if (fetched > 0) {
        std::cerr << std::endl;
    }
    return mapping;
}

void LabelFetcher::write_mapping(const std::filesystem::path& path, const LabelMapping& mapping) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IoError("Cannot create directory", path.parent_path());
        }
    }

    std::vector<const LabelMapping::value_type*> rows;
    rows.reserve(mapping.size());
    for (const auto& entry : mapping) {
        rows.push_back(&entry);
    }
    std::sort(rows.begin(), rows.end(),
              [](const auto* a, const auto* b) { return a->first < b->first; });

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IoError("Cannot create file", path);
    }
    for (const auto* row : rows) {
        out << row->first << '\t' << row->second << '\n';
    }
    out.close();
    if (!out) {
        throw IoError("Failed to write file", path);
    }
}

} // namespace tkgstats
