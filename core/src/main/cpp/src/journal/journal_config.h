/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Burrow project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace burrow {
namespace journal {

/**
 * Connection and identity settings of a database journal.
 *
 * url is either "jdbc:<schema>:<database path>" or a bare database path.
 * When schema is empty it is taken from the second colon-delimited field
 * of the url, falling back to "default". The schema picks the DDL script
 * "<schema>.ddl" under ddl_path.
 */
struct JournalConfig {
    std::string journal_id;
    std::string driver               = "sqlite";
    std::string url;
    std::string schema;
    std::string schema_object_prefix;
    std::string user;
    std::string password;
    std::string ddl_path;
    int         busy_timeout_ms      = 5000;

    // File holding the last revision this member has seen; empty keeps it in memory
    std::string revision_path;

    static JournalConfig defaults(const std::string& journal_id, const std::string& url) {
        JournalConfig cfg;
        cfg.journal_id = journal_id;
        cfg.url = url;

        if (const char* env = std::getenv("BURROW_JOURNAL_PREFIX")) {
            cfg.schema_object_prefix = env;
        }

        if (const char* env = std::getenv("BURROW_JOURNAL_DDL_PATH")) {
            cfg.ddl_path = env;
        }

        if (const char* env = std::getenv("BURROW_JOURNAL_BUSY_TIMEOUT_MS")) {
            cfg.busy_timeout_ms = std::atoi(env);
        }

        return cfg;
    }

    // Second colon field of url, or empty when url has fewer than two colons
    static std::string schema_from_url(const std::string& url) {
        size_t start = url.find(':');
        if (start != std::string::npos) {
            size_t end = url.find(':', start + 1);
            if (end != std::string::npos) {
                return url.substr(start + 1, end - start - 1);
            }
        }
        return std::string();
    }

    // The database file named by url
    std::string database_path() const {
        if (url.compare(0, 5, "jdbc:") == 0) {
            size_t end = url.find(':', 5);
            if (end != std::string::npos) {
                return url.substr(end + 1);
            }
        }
        return url;
    }

    std::string effective_schema() const {
        if (!schema.empty()) {
            return schema;
        }
        std::string s = schema_from_url(url);
        return s.empty() ? std::string("default") : s;
    }

    std::string effective_prefix() const {
        std::string p = schema_object_prefix;
        std::transform(p.begin(), p.end(), p.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return p;
    }

    bool validate() const {
        if (journal_id.empty() || driver.empty() || url.empty()) {
            return false;
        }
        if (driver != "sqlite") {
            return false;
        }
        if (busy_timeout_ms < 0) {
            return false;
        }
        // the prefix is spliced into table names
        for (char c : schema_object_prefix) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                return false;
            }
        }
        return true;
    }
};

/**
 * Commit retry policy of a cluster node.
 */
struct ClusterConfig {
    int max_commit_attempts = 3;
    int retry_backoff_ms    = 50;

    static ClusterConfig defaults() {
        ClusterConfig cfg;

        if (const char* env = std::getenv("BURROW_MAX_COMMIT_ATTEMPTS")) {
            cfg.max_commit_attempts = std::atoi(env);
        }

        if (const char* env = std::getenv("BURROW_RETRY_BACKOFF_MS")) {
            cfg.retry_backoff_ms = std::atoi(env);
        }

        return cfg;
    }

    bool validate() const {
        return max_commit_attempts >= 1 && retry_backoff_ms >= 0;
    }
};

} // namespace journal
} // namespace burrow
