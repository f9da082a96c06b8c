#pragma once

#include <bspidx/core/types.h>

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace bspidx::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind a string, or NULL when it is empty
     */
    Result<void> bindOptional(int index, const std::string& value);

    /**
     * @brief Bind multiple parameters starting at index 1
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    /**
     * @brief Reset statement and clear its bindings for reuse
     */
    Result<void> reset();

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly; accepts several ';'-separated statements
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();
    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute func inside BEGIN/COMMIT; rolls back when func fails or throws
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                auto rb = rollback();
                if (!rb)
                    logRollbackFailure(rb.error());
                return result;
            }
            auto commitResult = commit();
            if (!commitResult) {
                auto rb = rollback();
                if (!rb)
                    logRollbackFailure(rb.error());
            }
            return commitResult;
        } catch (...) {
            auto rb = rollback();
            if (!rb)
                logRollbackFailure(rb.error());
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<bool> tableExists(const std::string& table);
    Result<bool> hasFTS5();

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;

    static void logRollbackFailure(const Error& error);
};

} // namespace bspidx::metadata
