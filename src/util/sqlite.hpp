#ifndef _STC_UTIL_SQLITE_
#define _STC_UTIL_SQLITE_

#include "../pchheader.hpp"

// Statement binding and column helpers. Expect a 'sqlite3_stmt *stmt' in scope.
#define BIND_BLOB(idx, field) (field.size() > 0 && sqlite3_bind_blob(stmt, idx, field.data(), field.size(), SQLITE_STATIC) == SQLITE_OK)
#define BIND_OPT_BLOB(idx, field) (field.empty() ? sqlite3_bind_null(stmt, idx) == SQLITE_OK : BIND_BLOB(idx, field))
#define BIND_TEXT(idx, field) (sqlite3_bind_text(stmt, idx, field.data(), field.size(), SQLITE_STATIC) == SQLITE_OK)
#define BIND_U64(idx, field) (sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(field)) == SQLITE_OK)
#define GET_BLOB(idx) std::string((const char *)sqlite3_column_blob(stmt, idx), sqlite3_column_bytes(stmt, idx))
#define GET_TEXT(idx) std::string((const char *)sqlite3_column_text(stmt, idx), sqlite3_column_bytes(stmt, idx))
#define GET_U64(idx) static_cast<uint64_t>(sqlite3_column_int64(stmt, idx))

/**
 * Generic sqlite helpers shared by the ledger store and the oracle store.
 */
namespace util::sqlite
{
    /**
    * Define an enum and a string array for the column data types.
    * Any column data type that needs to be supportes should be added to both the 'COLUMN_DATA_TYPE' enum and the 'column_data_type' array in its respective order.
    */
    enum COLUMN_DATA_TYPE
    {
        INT,
        TEXT,
        BLOB
    };

    /**
     * Struct of table column information.
     * {
     *  string name   Name of the column.
     *  column_type   Data type of the column.
     *  is_key        Whether column is a key.
     *  is_null       Whether column is nullable.
     * }
    */
    struct table_column_info
    {
        std::string name;
        COLUMN_DATA_TYPE column_type;
        bool is_key;
        bool is_null;

        table_column_info(std::string_view name, const COLUMN_DATA_TYPE &column_type, const bool is_key = false, const bool is_null = true)
            : name(name), column_type(column_type), is_key(is_key), is_null(is_null)
        {
        }
    };

    int open_db(std::string_view db_name, sqlite3 **db);

    int exec_sql(sqlite3 *db, std::string_view sql, int (*callback)(void *, int, char **, char **) = NULL, void *callback_first_arg = NULL);

    int begin_transaction(sqlite3 *db);

    int commit_transaction(sqlite3 *db);

    int rollback_transaction(sqlite3 *db);

    int create_table(sqlite3 *db, std::string_view table_name, const std::vector<table_column_info> &column_info, std::string_view table_constraint = {});

    int create_index(sqlite3 *db, std::string_view table_name, std::string_view column_names, const bool is_unique);

    bool is_table_exists(sqlite3 *db, std::string_view table_name);

    int close_db(sqlite3 **db);

} // namespace util::sqlite

#endif
