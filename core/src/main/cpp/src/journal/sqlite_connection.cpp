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

#include "sqlite_connection.h"
#include "../errors.h"
#include "../util/log.h"

namespace burrow {
    namespace journal {

        void throw_sqlite_error(sqlite3* db, int rc, const std::string& what) {
            std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
            int primary = rc & 0xff;
            if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
                throw ConcurrencyViolationError(msg);
            }
            throw JournalError(msg);
        }

        // Statement

        Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr), sql_(sql) {
            int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
            if (rc != SQLITE_OK) {
                sqlite3_finalize(stmt_);
                stmt_ = nullptr;
                throw_sqlite_error(db_, rc, "Failed to prepare '" + sql + "'");
            }
        }

        Statement::~Statement() {
            sqlite3_finalize(stmt_);
        }

        void Statement::bind(int idx, int64_t v) {
            int rc = sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
            if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "Failed to bind parameter " + std::to_string(idx));
        }

        void Statement::bind(int idx, const std::string& v) {
            int rc = sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "Failed to bind parameter " + std::to_string(idx));
        }

        void Statement::bind_blob(int idx, const std::vector<uint8_t>& v) {
            int rc = v.empty()
                ? sqlite3_bind_zeroblob(stmt_, idx, 0)
                : sqlite3_bind_blob(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            if (rc != SQLITE_OK) throw_sqlite_error(db_, rc, "Failed to bind parameter " + std::to_string(idx));
        }

        bool Statement::step() {
            int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW) {
                return true;
            }
            if (rc == SQLITE_DONE) {
                return false;
            }
            // leave the statement reusable after an error
            sqlite3_reset(stmt_);
            throw_sqlite_error(db_, rc, "Failed to execute '" + sql_ + "'");
        }

        void Statement::execute() {
            while (step()) {
            }
        }

        void Statement::reset() {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }

        int64_t Statement::column_int64(int col) const {
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
        }

        std::string Statement::column_text(int col) const {
            const unsigned char* p = sqlite3_column_text(stmt_, col);
            if (!p) return std::string();
            return std::string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(stmt_, col));
        }

        std::vector<uint8_t> Statement::column_blob(int col) const {
            const uint8_t* p = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
            int n = sqlite3_column_bytes(stmt_, col);
            if (!p || n <= 0) return std::vector<uint8_t>();
            return std::vector<uint8_t>(p, p + n);
        }

        // Connection

        Connection::Connection(const std::string& path, int busy_timeout_ms) : path_(path) {
            int rc = sqlite3_open_v2(path.c_str(), &db_,
                                     SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX |
                                     SQLITE_OPEN_URI,
                                     nullptr);
            if (rc != SQLITE_OK) {
                std::string msg = "Failed to open database " + path + ": " +
                                  (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
                sqlite3_close(db_);
                db_ = nullptr;
                throw JournalError(msg);
            }
            sqlite3_busy_timeout(db_, busy_timeout_ms);
        }

        Connection::~Connection() {
            if (in_transaction()) {
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            }
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK) {
                warning() << "closing " << path_ << ": " << sqlite3_errstr(rc);
            }
        }

        void Connection::exec(const std::string& sql) {
            char* err = nullptr;
            int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
            if (rc != SQLITE_OK) {
                std::string msg = "Failed to execute '" + sql + "': " + (err ? err : sqlite3_errstr(rc));
                sqlite3_free(err);
                int primary = rc & 0xff;
                if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
                    throw ConcurrencyViolationError(msg);
                }
                throw JournalError(msg);
            }
        }

        std::unique_ptr<Statement> Connection::prepare(const std::string& sql) {
            return std::unique_ptr<Statement>(new Statement(db_, sql));
        }

        bool Connection::in_transaction() const {
            return db_ && sqlite3_get_autocommit(db_) == 0;
        }

        void Connection::set_auto_commit(bool on) {
            if (on == auto_commit_) {
                return;
            }
            if (on) {
                if (in_transaction()) {
                    exec("COMMIT");
                }
            } else if (!in_transaction()) {
                exec("BEGIN");
            }
            auto_commit_ = on;
        }

        void Connection::commit() {
            if (auto_commit_) {
                throw JournalError("commit while auto-commit is on");
            }
            if (in_transaction()) {
                exec("COMMIT");
            }
            exec("BEGIN");
        }

        void Connection::rollback() {
            if (auto_commit_) {
                throw JournalError("rollback while auto-commit is on");
            }
            if (in_transaction()) {
                exec("ROLLBACK");
            }
            exec("BEGIN");
        }

        bool Connection::table_exists(const std::string& name) {
            std::unique_ptr<Statement> stmt =
                prepare("SELECT name FROM sqlite_master WHERE type='table' AND upper(name) = upper(?)");
            stmt->bind(1, name);
            return stmt->step();
        }

    }
}
