#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace storage {

    class Database;

    /**
     * @brief Prepared statement, finalized on destruction.
     *
     * Bind indexes are 1-based and column indexes 0-based, as in SQLite.
     * Use only while holding the owning Database's lock.
     */
    class Statement {
    public:
        Statement(sqlite3 *db, const std::string &sql);

        ~Statement();

        Statement(Statement &&other) noexcept;

        Statement(const Statement &) = delete;

        Statement &operator=(const Statement &) = delete;

        Statement &operator=(Statement &&) = delete;

        Statement &bind(int index, int value);

        Statement &bind(int index, int64_t value);

        Statement &bind(int index, double value);

        Statement &bind(int index, const std::string &value);

        Statement &bind(int index, const char *value);

        Statement &bindNull(int index);

        template<typename T>
        Statement &bind(int index, const std::optional<T> &value) {
            if (value) return bind(index, *value);
            return bindNull(index);
        }

        /**
         * @return true while a result row is available
         */
        bool step();

        /**
         * @brief Step to completion, for statements without results
         */
        void run();

        void reset();

        bool isNull(int column) const;

        int columnInt(int column) const;

        int64_t columnInt64(int column) const;

        double columnDouble(int column) const;

        std::string columnText(int column) const;

        std::optional<int64_t> optionalInt64(int column) const;

        std::optional<double> optionalDouble(int column) const;

    private:
        sqlite3 *db_;
        sqlite3_stmt *stmt_;
        std::string sql_;

        void check(int rc, const char *what) const;
    };

    /**
     * @brief One SQLite connection shared by every worker.
     *
     * All access is serialised through a recursive mutex so repositories
     * can be called from inside an open Transaction on the same thread.
     */
    class Database {
    public:
        /**
         * @param path file name, or ":memory:" for a private in-memory database
         * @throws core::types::StorageException when the file cannot be opened
         */
        explicit Database(const std::string &path);

        ~Database();

        Database(const Database &) = delete;

        Database &operator=(const Database &) = delete;

        /**
         * @brief Create missing tables and indexes
         */
        void migrate();

        void execute(const std::string &sql);

        Statement prepare(const std::string &sql);

        int64_t lastInsertId() const;

        int changes() const;

        std::recursive_mutex &mutex() { return mutex_; }

        const std::string &path() const { return path_; }

        /**
         * @brief BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called.
         *
         * Holds the database lock for its whole lifetime. Nested transactions
         * on the same thread become savepoints.
         */
        class Transaction {
        public:
            explicit Transaction(Database &db);

            ~Transaction();

            Transaction(const Transaction &) = delete;

            Transaction &operator=(const Transaction &) = delete;

            void commit();

        private:
            Database &db_;
            std::unique_lock<std::recursive_mutex> lock_;
            int depth_;
            bool finished_ = false;
        };

    private:
        sqlite3 *db_ = nullptr;
        std::string path_;
        std::recursive_mutex mutex_;
        int transactionDepth_ = 0;
    };

} // namespace storage
