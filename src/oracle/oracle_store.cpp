#include "../pchheader.hpp"
#include "../util/sqlite.hpp"
#include "oracle_store.hpp"

namespace oracle::store
{
    namespace sql = util::sqlite;

    constexpr const char *CONFIRMATIONS_TABLE = "confirmations";
    constexpr const char *SNAPSHOTS_TABLE = "mileage_snapshots";
    constexpr const char *DECISIONS_TABLE = "decisions";

    constexpr const char *INSERT_CONFIRMATION = "INSERT OR IGNORE INTO confirmations(challenge_id, identity, signature, confirmed_at)"
                                                " VALUES(?,?,?,?)";
    constexpr const char *SELECT_CONFIRMATIONS = "SELECT identity FROM confirmations WHERE challenge_id=?";
    constexpr const char *INSERT_SNAPSHOT = "INSERT INTO mileage_snapshots(challenge_id, identity, correlation_id, centimiles,"
                                            " sample_count, taken_at) VALUES(?,?,?,?,?,?)";
    // Latest snapshot per identity. rowid grows with every insert so the max rowid is the last write.
    constexpr const char *SELECT_LATEST_SNAPSHOTS = "SELECT identity, correlation_id, centimiles, sample_count, taken_at"
                                                    " FROM mileage_snapshots WHERE rowid IN ("
                                                    "SELECT MAX(rowid) FROM mileage_snapshots WHERE challenge_id=? GROUP BY identity)";
    constexpr const char *INSERT_DECISION = "INSERT OR IGNORE INTO decisions(challenge_id, winner, result_hash, results, reason, decided_at)"
                                            " VALUES(?,?,?,?,?,?)";
    constexpr const char *SELECT_DECISION = "SELECT winner, result_hash, results, reason, decided_at FROM decisions WHERE challenge_id=?";

    int create_schema(sqlite3 *db)
    {
        if (sql::create_table(db, CONFIRMATIONS_TABLE, {sql::table_column_info("challenge_id", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                        sql::table_column_info("identity", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                        sql::table_column_info("signature", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                        sql::table_column_info("confirmed_at", sql::COLUMN_DATA_TYPE::INT, false, false)},
                              "PRIMARY KEY (challenge_id, identity)") == -1 ||
            sql::create_table(db, SNAPSHOTS_TABLE, {sql::table_column_info("challenge_id", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                    sql::table_column_info("identity", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                    sql::table_column_info("correlation_id", sql::COLUMN_DATA_TYPE::TEXT, false, false),
                                                    sql::table_column_info("centimiles", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                    sql::table_column_info("sample_count", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                    sql::table_column_info("taken_at", sql::COLUMN_DATA_TYPE::INT, false, false)}) == -1 ||
            sql::create_index(db, SNAPSHOTS_TABLE, "challenge_id,identity", false) == -1 ||
            sql::create_table(db, DECISIONS_TABLE, {sql::table_column_info("challenge_id", sql::COLUMN_DATA_TYPE::INT, true),
                                                    sql::table_column_info("winner", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                    sql::table_column_info("result_hash", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                    sql::table_column_info("results", sql::COLUMN_DATA_TYPE::TEXT, false, false),
                                                    sql::table_column_info("reason", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                    sql::table_column_info("decided_at", sql::COLUMN_DATA_TYPE::INT, false, false)}) == -1)
        {
            LOG_ERROR << "Error creating oracle schema.";
            return -1;
        }

        return 0;
    }

    /**
     * Records a participant's confirmation.
     * @returns 0 if inserted. 1 if the participant had already confirmed. -1 on error.
     */
    int insert_confirmation(sqlite3 *db, const uint64_t challenge_id, std::string_view identity, std::string_view signature, const uint64_t confirmed_at)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, INSERT_CONFIRMATION, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, challenge_id) &&
            BIND_BLOB(2, identity) &&
            BIND_BLOB(3, signature) &&
            BIND_U64(4, confirmed_at) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return sqlite3_changes(db) == 1 ? 0 : 1;
        }

        LOG_ERROR << "Error inserting confirmation. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int get_confirmed_identities(sqlite3 *db, const uint64_t challenge_id, std::unordered_set<std::string> &identities)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_CONFIRMATIONS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_U64(1, challenge_id))
        {
            LOG_ERROR << "Error querying confirmations. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int res;
        while ((res = sqlite3_step(stmt)) == SQLITE_ROW)
            identities.emplace(GET_BLOB(0));

        sqlite3_finalize(stmt);
        return res == SQLITE_DONE ? 0 : -1;
    }

    int insert_snapshot(sqlite3 *db, const mileage_snapshot &snapshot)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, INSERT_SNAPSHOT, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, snapshot.challenge_id) &&
            BIND_BLOB(2, snapshot.identity) &&
            BIND_TEXT(3, snapshot.correlation_id) &&
            BIND_U64(4, snapshot.centimiles) &&
            BIND_U64(5, snapshot.sample_count) &&
            BIND_U64(6, snapshot.taken_at) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting mileage snapshot. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Populates the most recent snapshot of every identity that has one, keyed by identity.
     */
    int get_latest_snapshots(sqlite3 *db, const uint64_t challenge_id, std::unordered_map<std::string, mileage_snapshot> &snapshots)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_LATEST_SNAPSHOTS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_U64(1, challenge_id))
        {
            LOG_ERROR << "Error querying mileage snapshots. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int res;
        while ((res = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            mileage_snapshot snapshot;
            snapshot.challenge_id = challenge_id;
            snapshot.identity = GET_BLOB(0);
            snapshot.correlation_id = GET_TEXT(1);
            snapshot.centimiles = GET_U64(2);
            snapshot.sample_count = GET_U64(3);
            snapshot.taken_at = GET_U64(4);
            snapshots[snapshot.identity] = std::move(snapshot);
        }

        sqlite3_finalize(stmt);
        return res == SQLITE_DONE ? 0 : -1;
    }

    /**
     * Stores a decision unless one already exists for the challenge. The first decision always wins.
     */
    int save_decision(sqlite3 *db, const decision_record &decision)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, INSERT_DECISION, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, decision.challenge_id) &&
            BIND_BLOB(2, decision.winner) &&
            BIND_BLOB(3, decision.result_hash) &&
            BIND_TEXT(4, decision.results) &&
            sqlite3_bind_int(stmt, 5, decision.reason) == SQLITE_OK &&
            BIND_U64(6, decision.decided_at) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error saving decision. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * @returns 1 if a decision exists for the challenge. 0 if not. -1 on error.
     */
    int get_decision(sqlite3 *db, const uint64_t challenge_id, decision_record &decision)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_DECISION, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, challenge_id))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                decision.challenge_id = challenge_id;
                decision.winner = GET_BLOB(0);
                decision.result_hash = GET_BLOB(1);
                decision.results = GET_TEXT(2);
                decision.reason = static_cast<FINALIZATION_REASON>(sqlite3_column_int(stmt, 3));
                decision.decided_at = GET_U64(4);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error querying decision of challenge " << challenge_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

} // namespace oracle::store
