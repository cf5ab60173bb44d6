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

#include "database_journal.h"
#include "../errors.h"
#include "../util/log.h"
#include <boost/filesystem.hpp>
#include <fstream>
#include <sstream>

namespace burrow {
    namespace journal {

        namespace fs = boost::filesystem;

        namespace {
            const char* const kDefaultDdl =
                "# journal schema, one statement per line\n"
                "create table ${schemaObjectPrefix}JOURNAL (REVISION_ID BIGINT NOT NULL, JOURNAL_ID varchar(255), "
                "PRODUCER_ID varchar(255), REVISION_DATA BLOB)\n"
                "create index ${schemaObjectPrefix}JOURNAL_IDX on ${schemaObjectPrefix}JOURNAL (REVISION_ID)\n"
                "create table ${schemaObjectPrefix}GLOBAL_REVISION (revision_id BIGINT NOT NULL)\n"
                "insert into ${schemaObjectPrefix}GLOBAL_REVISION VALUES(0)\n";

            std::string replace_all(std::string s, const std::string& from, const std::string& to) {
                size_t pos = 0;
                while ((pos = s.find(from, pos)) != std::string::npos) {
                    s.replace(pos, from.size(), to);
                    pos += to.size();
                }
                return s;
            }
        }

        const char* DatabaseJournal::default_ddl() {
            return kDefaultDdl;
        }

        DatabaseJournal::DatabaseJournal(const JournalConfig& config)
            : Journal(config.journal_id, config.revision_path), config_(config) {}

        DatabaseJournal::~DatabaseJournal() {
            close();
        }

        void DatabaseJournal::init() {
            if (con_) {
                throw InvalidItemStateError("journal " + id() + " already initialized");
            }
            if (config_.driver.empty()) {
                throw JournalError("Driver not specified.");
            }
            if (config_.url.empty()) {
                throw JournalError("Connection URL not specified.");
            }
            if (!config_.validate()) {
                throw JournalError("Invalid journal configuration for driver '" + config_.driver + "'");
            }

            Journal::init();
            schema_ = config_.effective_schema();
            prefix_ = config_.effective_prefix();

            try {
                con_ = std::make_unique<Connection>(config_.database_path(), config_.busy_timeout_ms);
                con_->set_auto_commit(true);
                check_schema();
                prepare_statements();
            } catch (const JournalError& e) {
                insert_revision_stmt_.reset();
                select_global_stmt_.reset();
                update_global_stmt_.reset();
                con_.reset();
                throw JournalError("Unable to initialize connection.", e);
            }
            info() << "DatabaseJournal initialized at URL: " << config_.url;
        }

        void DatabaseJournal::close() {
            insert_revision_stmt_.reset();
            select_global_stmt_.reset();
            update_global_stmt_.reset();
            con_.reset();
        }

        std::vector<std::string> DatabaseJournal::load_ddl() {
            std::string text;
            if (!config_.ddl_path.empty()) {
                fs::path dir(config_.ddl_path);
                fs::path script = dir / (schema_ + ".ddl");
                if (!fs::exists(script)) {
                    info() << "No schema-specific DDL found: '" << script.string() << "', falling back to '"
                           << kDefaultDdlName << "'.";
                    script = dir / kDefaultDdlName;
                }
                if (fs::exists(script)) {
                    std::ifstream in(script.string().c_str());
                    if (!in) {
                        throw JournalError("Unable to load '" + script.string() + "'.");
                    }
                    std::ostringstream ss;
                    ss << in.rdbuf();
                    text = ss.str();
                } else {
                    info() << "no DDL script under " << dir.string() << ", using the built-in schema";
                }
            }
            if (text.empty()) {
                text = kDefaultDdl;
            }

            std::vector<std::string> statements;
            std::istringstream lines(text);
            std::string sql;
            while (std::getline(lines, sql)) {
                if (!sql.empty() && sql[sql.size() - 1] == '\r') {
                    sql.erase(sql.size() - 1);
                }
                // comments and empty lines
                if (sql.empty() || sql[0] == '#') {
                    continue;
                }
                statements.push_back(replace_all(sql, kSchemaObjectPrefixVariable, prefix_));
            }
            return statements;
        }

        void DatabaseJournal::check_schema() {
            const std::string table = prefix_ + "JOURNAL";
            if (con_->table_exists(table)) {
                return;
            }
            info() << "creating journal schema " << schema_ << " with prefix '" << prefix_ << "'";
            for (const std::string& sql : load_ddl()) {
                con_->exec(sql);
            }
        }

        void DatabaseJournal::prepare_statements() {
            update_global_stmt_ = con_->prepare(
                "update " + prefix_ + "GLOBAL_REVISION set revision_id = revision_id + 1");
            select_global_stmt_ = con_->prepare(
                "select revision_id from " + prefix_ + "GLOBAL_REVISION");
            insert_revision_stmt_ = con_->prepare(
                "insert into " + prefix_ + "JOURNAL (REVISION_ID, JOURNAL_ID, PRODUCER_ID, REVISION_DATA) "
                "values (?,?,?,?)");
        }

        std::unique_ptr<RecordIterator> DatabaseJournal::get_records(int64_t start) {
            if (!con_) {
                throw InvalidItemStateError("journal " + id() + " not initialized");
            }
            try {
                std::unique_ptr<Statement> stmt = con_->prepare(
                    "select REVISION_ID, JOURNAL_ID, PRODUCER_ID, REVISION_DATA from " + prefix_ +
                    "JOURNAL where REVISION_ID > ? order by REVISION_ID, rowid");
                stmt->bind(1, start);
                return std::make_unique<DatabaseRecordIterator>(std::move(stmt));
            } catch (const JournalError& e) {
                throw JournalError("Unable to return record iterator.", e);
            }
        }

        int64_t DatabaseJournal::global_revision() {
            if (!con_) {
                throw InvalidItemStateError("journal " + id() + " not initialized");
            }
            std::unique_ptr<Statement> stmt = con_->prepare("select revision_id from " + prefix_ + "GLOBAL_REVISION");
            if (!stmt->step()) {
                throw JournalError("No revision available.");
            }
            return stmt->column_int64(0);
        }

        void DatabaseJournal::rollback_quietly() {
            if (con_->auto_commit()) {
                return;
            }
            try {
                con_->rollback();
            } catch (const JournalError& e) {
                error() << "Error while rolling back connection: " << e.what();
            }
        }

        void DatabaseJournal::restore_auto_commit() {
            try {
                con_->set_auto_commit(true);
            } catch (const JournalError& e) {
                warning() << "Unable to set autocommit to true: " << e.what();
            }
        }

        int64_t DatabaseJournal::do_lock() {
            if (!con_) {
                throw InvalidItemStateError("journal " + id() + " not initialized");
            }
            try {
                con_->set_auto_commit(false);
            } catch (const JournalError& e) {
                throw JournalError("Unable to set autocommit to false.", e);
            }

            int64_t revision = 0;
            try {
                update_global_stmt_->reset();
                update_global_stmt_->execute();

                select_global_stmt_->reset();
                if (!select_global_stmt_->step()) {
                    select_global_stmt_->reset();
                    throw JournalError("No revision available.");
                }
                revision = select_global_stmt_->column_int64(0);
                select_global_stmt_->reset();
            } catch (const ConcurrencyViolationError& e) {
                rollback_quietly();
                restore_auto_commit();
                throw ConcurrencyViolationError(std::string("Unable to lock global revision table: ") + e.what());
            } catch (const JournalError& e) {
                rollback_quietly();
                restore_auto_commit();
                throw JournalError("Unable to lock global revision table.", e);
            }
            return revision;
        }

        void DatabaseJournal::do_append(const Record& record) {
            try {
                try {
                    insert_revision_stmt_->reset();
                    insert_revision_stmt_->bind(1, record.revision);
                    insert_revision_stmt_->bind(2, record.journal_id);
                    insert_revision_stmt_->bind(3, record.producer_id);
                    insert_revision_stmt_->bind_blob(4, record.data);
                    insert_revision_stmt_->execute();
                    insert_revision_stmt_->reset();

                    // commit() reopens the transaction; auto-commit stays off
                    // until do_unlock() so later records join the same session
                    con_->commit();
                } catch (const JournalError&) {
                    insert_revision_stmt_->reset();
                    // the failed transaction is rolled back by unlock(false)
                    throw;
                }
            } catch (const JournalError& e) {
                throw JournalError("Unable to append revision " + std::to_string(record.revision) + ".", e);
            }
        }

        void DatabaseJournal::do_unlock(bool successful) {
            if (!successful) {
                rollback_quietly();
            }
            restore_auto_commit();
        }

        // DatabaseRecordIterator

        DatabaseRecordIterator::DatabaseRecordIterator(std::unique_ptr<Statement> stmt) : stmt_(std::move(stmt)) {}

        bool DatabaseRecordIterator::has_next() {
            if (done_) {
                return false;
            }
            if (!fetched_) {
                fetched_ = stmt_->step();
                done_ = !fetched_;
            }
            return fetched_;
        }

        Record DatabaseRecordIterator::next() {
            if (!has_next()) {
                throw JournalError("no more journal records");
            }
            Record r;
            r.revision = stmt_->column_int64(0);
            r.journal_id = stmt_->column_text(1);
            r.producer_id = stmt_->column_text(2);
            r.data = stmt_->column_blob(3);
            fetched_ = false;
            return r;
        }

    }
}
