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
#include <cerrno>
#include <stdexcept>
#include <string>

namespace burrow {

    /**
     * Storage failure while reading or writing item state (bundles, references,
     * blobs). The message carries the root cause.
     */
    class ItemStateError : public std::runtime_error {
    public:
        explicit ItemStateError(const std::string& msg) : std::runtime_error(msg) {}
        ItemStateError(const std::string& msg, const std::exception& cause)
            : std::runtime_error(msg + ": " + cause.what()) {}

        // a caller may refresh and retry the whole operation
        virtual bool is_retryable() const { return false; }
    };

    // The bundle, references record or blob does not exist.
    class NoSuchItemStateError : public ItemStateError {
    public:
        explicit NoSuchItemStateError(const std::string& msg) : ItemStateError(msg) {}
    };

    // Optimistic-concurrency conflict: the persisted copy changed underneath.
    class StaleItemStateError : public ItemStateError {
    public:
        explicit StaleItemStateError(const std::string& msg) : ItemStateError(msg) {}
        bool is_retryable() const override { return true; }
    };

    // Operation invoked outside its valid lifecycle phase.
    class InvalidItemStateError : public std::logic_error {
    public:
        explicit InvalidItemStateError(const std::string& msg) : std::logic_error(msg) {}
    };

    // Item filesystem failure; err is the errno reported by the platform call.
    class FileSystemError : public std::runtime_error {
    public:
        FileSystemError(const std::string& msg, int err)
            : std::runtime_error(msg), err_(err) {}

        int error_code() const { return err_; }
        bool is_not_found() const { return err_ == ENOENT; }

    private:
        int err_;
    };

    class JournalError : public std::runtime_error {
    public:
        explicit JournalError(const std::string& msg) : std::runtime_error(msg) {}
        JournalError(const std::string& msg, const std::exception& cause)
            : std::runtime_error(msg + ": " + cause.what()) {}
    };

    // Global revision lock held by another cluster member.
    class ConcurrencyViolationError : public JournalError {
    public:
        explicit ConcurrencyViolationError(const std::string& msg) : JournalError(msg) {}
    };

} // namespace burrow
