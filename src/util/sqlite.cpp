#include "../pchheader.hpp"
#include "sqlite.hpp"

namespace util::sqlite
{
    constexpr const char *COLUMN_DATA_TYPES[]{"INT", "TEXT", "BLOB"};
    constexpr const char *CREATE_TABLE = "CREATE TABLE IF NOT EXISTS ";
    constexpr const char *CREATE_INDEX = "CREATE INDEX IF NOT EXISTS ";
    constexpr const char *CREATE_UNIQUE_INDEX = "CREATE UNIQUE INDEX IF NOT EXISTS ";
    constexpr const char *FOREIGN_KEYS_ON = "PRAGMA foreign_keys=ON";
    constexpr const char *BEGIN_TRANSACTION = "BEGIN TRANSACTION;";
    constexpr const char *COMMIT_TRANSACTION = "COMMIT;";
    constexpr const char *ROLLBACK_TRANSACTION = "ROLLBACK;";
    constexpr const char *PRIMARY_KEY = "PRIMARY KEY";
    constexpr const char *NOT_NULL = "NOT NULL";
    constexpr const char *SELECT_TABLE = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

    /**
     * Opens a connection to a given databse and give the db pointer.
     * Journaling is left on because every settlement write relies on transaction rollback.
     * @param db_name Database name to be connected. ":memory:" opens a private in-memory database.
     * @param db Pointer to the db pointer which is to be connected and pointed.
     * @returns returns 0 on success, or -1 on error.
    */
    int open_db(std::string_view db_name, sqlite3 **db)
    {
        int ret;
        if ((ret = sqlite3_open(db_name.data(), db)) != SQLITE_OK)
        {
            LOG_ERROR << "Can't open database: " << ret << ", " << sqlite3_errmsg(*db);
            sqlite3_close(*db);
            *db = NULL;
            return -1;
        }

        if (exec_sql(*db, FOREIGN_KEYS_ON) == -1)
        {
            close_db(db);
            return -1;
        }

        return 0;
    }

    /**
     * Executes given sql query.
     * @param db Pointer to the db.
     * @param sql Sql query to be executed.
     * @param callback Callback funcion which is called for each result row.
     * @param callback_first_arg First data argumat to be parced to the callback (void pointer).
     * @returns returns 0 on success, or -1 on error.
    */
    int exec_sql(sqlite3 *db, std::string_view sql, int (*callback)(void *, int, char **, char **), void *callback_first_arg)
    {
        char *err_msg;
        if (sqlite3_exec(db, sql.data(), callback, (callback != NULL ? (void *)callback_first_arg : NULL), &err_msg) != SQLITE_OK)
        {
            LOG_ERROR << "SQL error occured: " << err_msg;
            sqlite3_free(err_msg);
            return -1;
        }
        return 0;
    }

    int begin_transaction(sqlite3 *db)
    {
        return exec_sql(db, BEGIN_TRANSACTION);
    }

    int commit_transaction(sqlite3 *db)
    {
        return exec_sql(db, COMMIT_TRANSACTION);
    }

    int rollback_transaction(sqlite3 *db)
    {
        return exec_sql(db, ROLLBACK_TRANSACTION);
    }

    /**
     * Create a table with given table info.
     * @param db Pointer to the db.
     * @param table_name Table name to be created.
     * @param column_info Column info of the table.
     * @param table_constraint Optional table level constraint (eg: "PRIMARY KEY (a, b)").
     * @returns returns 0 on success, or -1 on error.
    */
    int create_table(sqlite3 *db, std::string_view table_name, const std::vector<table_column_info> &column_info, std::string_view table_constraint)
    {
        std::string sql;
        sql.append(CREATE_TABLE).append(table_name).append(" (");

        for (auto itr = column_info.begin(); itr != column_info.end(); ++itr)
        {
            sql.append(itr->name);
            sql.append(" ");
            sql.append(COLUMN_DATA_TYPES[itr->column_type]);

            if (itr->is_key)
            {
                sql.append(" ");
                sql.append(PRIMARY_KEY);
            }

            if (!itr->is_null)
            {
                sql.append(" ");
                sql.append(NOT_NULL);
            }

            if (itr != column_info.end() - 1)
                sql.append(",");
        }

        if (!table_constraint.empty())
            sql.append(",").append(table_constraint);

        sql.append(")");

        const int ret = exec_sql(db, sql);
        if (ret == -1)
            LOG_ERROR << "Error when creating sqlite table " << table_name;

        return ret;
    }

    int create_index(sqlite3 *db, std::string_view table_name, std::string_view column_names, const bool is_unique)
    {
        std::string index_name = std::string("idx_").append(table_name).append("_").append(column_names);
        std::replace(index_name.begin(), index_name.end(), ',', '_');

        std::string sql;
        sql.append(is_unique ? CREATE_UNIQUE_INDEX : CREATE_INDEX)
            .append(index_name)
            .append(" ON ")
            .append(table_name)
            .append("(")
            .append(column_names)
            .append(")");

        const int ret = exec_sql(db, sql);
        if (ret == -1)
            LOG_ERROR << "Error when creating sqlite index '" << index_name << "' in table " << table_name;

        return ret;
    }

    /**
     * Checks whether table exist in the database.
     * @param db Pointer to the db.
     * @param table_name Table name to be checked.
     * @returns returns true is exist, otherwise false.
    */
    bool is_table_exists(sqlite3 *db, std::string_view table_name)
    {
        sqlite3_stmt *stmt = NULL;
        bool exists = false;

        if (sqlite3_prepare_v2(db, SELECT_TABLE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            sqlite3_bind_text(stmt, 1, table_name.data(), table_name.size(), SQLITE_STATIC) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW)
            exists = true;

        // Finalize and distroys the statement.
        sqlite3_finalize(stmt);
        return exists;
    }

    /**
     * Closes a connection to a given databse.
     * @param db Pointer to the db.
     * @returns returns 0 on success, or -1 on error.
    */
    int close_db(sqlite3 **db)
    {
        if (*db == NULL)
            return 0;

        if (sqlite3_close(*db) != SQLITE_OK)
        {
            LOG_ERROR << "Can't close database: " << sqlite3_errmsg(*db);
            return -1;
        }

        *db = NULL;
        return 0;
    }

} // namespace util::sqlite
