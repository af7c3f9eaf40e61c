// =============================================================================
// AutoLink - Address History Store
// =============================================================================
// Read-modify-write of the JSON history file. Every mutation rewrites the
// whole list.
// =============================================================================
#include "address_history_store.hpp"
#include "autolink_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>

#include <sys/stat.h>
#include <unistd.h>

namespace autolink {

namespace {

const char* const BLACKLIST[] = {"127.0.0.1", "0.0.0.0"};

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

// mkdir -p for the parent of path
void ensureParentDir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return;
    std::string dir = path.substr(0, slash);
    for (size_t i = 1; i <= dir.size(); ++i) {
        if (i == dir.size() || dir[i] == '/') {
            ::mkdir(dir.substr(0, i).c_str(), 0755);
        }
    }
}

} // namespace

std::string AddressRecord::detail() const {
    if (!last_seen_ms) return {};
    std::time_t secs = static_cast<std::time_t>(*last_seen_ms / 1000);
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Last connected: %04d/%02d/%02d %02d:%02d:%02d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    return buf;
}

AddressHistoryStore::AddressHistoryStore(std::string path, std::string key)
    : path_(std::move(path)), key_(std::move(key)) {}

std::string AddressHistoryStore::stripDisplayPrefix(const std::string& text) {
    std::string t = trim(text);
    auto pos = t.rfind("] - ");
    if (pos == std::string::npos) return t;
    return trim(t.substr(pos + 4));
}

std::string AddressHistoryStore::ipOf(const std::string& entry) {
    auto bar = entry.find('|');
    return bar == std::string::npos ? entry : entry.substr(0, bar);
}

bool AddressHistoryStore::isBlacklisted(const std::string& ip) {
    std::string host = ip.substr(0, ip.find(':'));
    for (const char* b : BLACKLIST) {
        if (host == b) return true;
    }
    return false;
}

int64_t AddressHistoryStore::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<std::string> AddressHistoryStore::loadEntries() const {
    std::vector<std::string> entries;
    std::ifstream file(path_);
    if (!file.is_open()) return entries;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object() || !j.contains(key_) || !j[key_].is_array()) return entries;
        for (const auto& item : j[key_]) {
            if (item.is_string()) entries.push_back(item.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        ALOG_WARN("history", "%s unreadable, treating as empty: %s", path_.c_str(), e.what());
        entries.clear();
    }
    return entries;
}

VoidResult AddressHistoryStore::storeEntries(const std::vector<std::string>& entries) {
    nlohmann::json doc = nlohmann::json::object();
    {
        std::ifstream in(path_);
        if (in.is_open()) {
            try {
                nlohmann::json existing = nlohmann::json::parse(in);
                if (existing.is_object()) doc = std::move(existing);
            } catch (const nlohmann::json::exception& e) {
                ALOG_WARN("history", "Overwriting unreadable %s: %s", path_.c_str(), e.what());
            }
        }
    }
    doc[key_] = entries;

    ensureParentDir(path_);
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return Err<void>(ErrorCode::Io, "cannot write " + tmp);
        }
        out << doc.dump(2) << "\n";
        if (!out.good()) {
            return Err<void>(ErrorCode::Io, "write failed: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        ::unlink(tmp.c_str());
        return Err<void>(ErrorCode::Io, "cannot replace " + path_);
    }
    return Ok();
}

std::vector<AddressRecord> AddressHistoryStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AddressRecord> records;
    for (const auto& raw : loadEntries()) {
        std::string entry = stripDisplayPrefix(raw);
        AddressRecord rec;
        auto bar = entry.find('|');
        rec.ip = entry.substr(0, bar);
        if (bar != std::string::npos) {
            std::string ts = entry.substr(bar + 1);
            if (allDigits(ts)) {
                try {
                    rec.last_seen_ms = std::stoll(ts);
                } catch (const std::out_of_range&) {
                    ALOG_DEBUG("history", "Timestamp out of range for %s", rec.ip.c_str());
                }
            }
        }
        if (!rec.ip.empty()) records.push_back(std::move(rec));
    }
    return records;
}

VoidResult AddressHistoryStore::replace(const std::vector<std::string>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> kept;
    std::set<std::string> seen;
    for (const auto& raw : entries) {
        std::string entry = stripDisplayPrefix(raw);
        std::string ip = ipOf(entry);
        if (ip.empty() || isBlacklisted(ip)) continue;
        if (!seen.insert(ip).second) continue;
        kept.push_back(entry);
    }
    ALOG_DEBUG("history", "replace: %zu in, %zu kept", entries.size(), kept.size());
    return storeEntries(kept);
}

VoidResult AddressHistoryStore::recordAttach(const std::string& ip) {
    return recordAttach(ip, nowMs());
}

VoidResult AddressHistoryStore::recordAttach(const std::string& ip, int64_t now_ms) {
    if (ip.empty() || isBlacklisted(ip)) return Ok();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> entries = loadEntries();
    std::vector<std::string> rest;
    rest.reserve(entries.size());
    size_t matched = 0;
    for (const auto& raw : entries) {
        std::string entry = stripDisplayPrefix(raw);
        if (ipOf(entry) == ip) {
            ++matched;
            continue;
        }
        rest.push_back(entry);
    }
    if (matched > 1) {
        ALOG_WARN("history", "%zu records for %s collapsed into one", matched, ip.c_str());
    }

    rest.insert(rest.begin(), ip + "|" + std::to_string(now_ms));
    ALOG_DEBUG("history", "%s %s", matched ? "Relocated" : "Recorded", ip.c_str());
    return storeEntries(rest);
}

Result<size_t> AddressHistoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = loadEntries().size();
    auto r = storeEntries({});
    if (r.is_err()) return Err<size_t>(r.error());
    ALOG_INFO("history", "Cleared %zu record(s)", total);
    return Ok(total);
}

Result<size_t> AddressHistoryStore::purgeBlacklisted() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> entries = loadEntries();
    std::vector<std::string> kept;
    for (const auto& raw : entries) {
        if (!isBlacklisted(ipOf(stripDisplayPrefix(raw)))) kept.push_back(raw);
    }
    size_t removed = entries.size() - kept.size();
    if (removed == 0) return Ok(removed);
    auto r = storeEntries(kept);
    if (r.is_err()) return Err<size_t>(r.error());
    return Ok(removed);
}

} // namespace autolink
