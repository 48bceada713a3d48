#include "../pchheader.hpp"
#include "../util/sqlite.hpp"
#include "../util/version.hpp"
#include "ledger_store.hpp"

namespace ledger::store
{
    namespace sql = util::sqlite;

    constexpr const char *META_TABLE = "meta";
    constexpr const char *ATTESTER_TABLE = "attester";
    constexpr const char *CHALLENGES_TABLE = "challenges";
    constexpr const char *WHITELIST_TABLE = "whitelist";
    constexpr const char *PARTICIPANTS_TABLE = "participants";
    constexpr const char *BALANCES_TABLE = "balances";

    constexpr const char *LEDGER_VERSION_KEY = "ledger_version";

    constexpr const char *INSERT_META = "INSERT OR REPLACE INTO meta(key, value) VALUES(?,?)";
    constexpr const char *SELECT_META = "SELECT value FROM meta WHERE key=?";
    constexpr const char *SAVE_ATTESTER = "INSERT OR REPLACE INTO attester(slot, pubkey, version) VALUES(0,?,?)";
    constexpr const char *SELECT_ATTESTER = "SELECT pubkey, version FROM attester WHERE slot=0";
    constexpr const char *INSERT_CHALLENGE = "INSERT INTO challenges(id, creator, start_time, end_time, stake_amount,"
                                             " total_staked, state, winner, result_hash, participant_count)"
                                             " VALUES(?,?,?,?,?,?,?,?,?,?)";
    constexpr const char *UPDATE_CHALLENGE = "UPDATE challenges SET total_staked=?, state=?, winner=?, result_hash=?,"
                                             " participant_count=? WHERE id=?";
    constexpr const char *INSERT_WHITELIST = "INSERT INTO whitelist(challenge_id, seq, identity) VALUES(?,?,?)";
    constexpr const char *INSERT_PARTICIPANT = "INSERT INTO participants(challenge_id, identity, correlation_id, stake,"
                                               " join_seq, joined_at) VALUES(?,?,?,?,?,?)";
    constexpr const char *UPDATE_PARTICIPANT_STAKE = "UPDATE participants SET stake=? WHERE challenge_id=? AND identity=?";
    constexpr const char *SAVE_BALANCE = "INSERT OR REPLACE INTO balances(identity, deposited, released) VALUES(?,?,?)";
    constexpr const char *SELECT_CHALLENGES = "SELECT id, creator, start_time, end_time, stake_amount, total_staked, state,"
                                              " winner, result_hash, participant_count FROM challenges ORDER BY id ASC";
    constexpr const char *SELECT_WHITELIST = "SELECT identity FROM whitelist WHERE challenge_id=? ORDER BY seq ASC";
    constexpr const char *SELECT_PARTICIPANTS = "SELECT identity, correlation_id, stake, join_seq, joined_at FROM participants"
                                                " WHERE challenge_id=? ORDER BY join_seq ASC";
    constexpr const char *SELECT_BALANCES = "SELECT identity, deposited, released FROM balances";

    /**
     * Creates all ledger tables and stamps the ledger version. Safe to call on an existing db.
     * @returns 0 on success. -1 on failure.
     */
    int create_schema(sqlite3 *db)
    {
        if (sql::create_table(db, META_TABLE, {sql::table_column_info("key", sql::COLUMN_DATA_TYPE::TEXT, true),
                                               sql::table_column_info("value", sql::COLUMN_DATA_TYPE::TEXT, false, false)}) == -1 ||
            sql::create_table(db, ATTESTER_TABLE, {sql::table_column_info("slot", sql::COLUMN_DATA_TYPE::INT, true),
                                                   sql::table_column_info("pubkey", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                   sql::table_column_info("version", sql::COLUMN_DATA_TYPE::INT, false, false)}) == -1 ||
            sql::create_table(db, CHALLENGES_TABLE, {sql::table_column_info("id", sql::COLUMN_DATA_TYPE::INT, true),
                                                     sql::table_column_info("creator", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                     sql::table_column_info("start_time", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                     sql::table_column_info("end_time", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                     sql::table_column_info("stake_amount", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                     sql::table_column_info("total_staked", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                     sql::table_column_info("state", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                     sql::table_column_info("winner", sql::COLUMN_DATA_TYPE::BLOB),
                                                     sql::table_column_info("result_hash", sql::COLUMN_DATA_TYPE::BLOB),
                                                     sql::table_column_info("participant_count", sql::COLUMN_DATA_TYPE::INT, false, false)}) == -1 ||
            sql::create_table(db, WHITELIST_TABLE, {sql::table_column_info("challenge_id", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                    sql::table_column_info("seq", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                    sql::table_column_info("identity", sql::COLUMN_DATA_TYPE::BLOB, false, false)},
                              "PRIMARY KEY (challenge_id, seq), FOREIGN KEY (challenge_id) REFERENCES challenges(id)") == -1 ||
            sql::create_table(db, PARTICIPANTS_TABLE, {sql::table_column_info("challenge_id", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                       sql::table_column_info("identity", sql::COLUMN_DATA_TYPE::BLOB, false, false),
                                                       sql::table_column_info("correlation_id", sql::COLUMN_DATA_TYPE::TEXT, false, false),
                                                       sql::table_column_info("stake", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                       sql::table_column_info("join_seq", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                       sql::table_column_info("joined_at", sql::COLUMN_DATA_TYPE::INT, false, false)},
                              "PRIMARY KEY (challenge_id, identity), FOREIGN KEY (challenge_id) REFERENCES challenges(id)") == -1 ||
            sql::create_table(db, BALANCES_TABLE, {sql::table_column_info("identity", sql::COLUMN_DATA_TYPE::BLOB, true),
                                                   sql::table_column_info("deposited", sql::COLUMN_DATA_TYPE::INT, false, false),
                                                   sql::table_column_info("released", sql::COLUMN_DATA_TYPE::INT, false, false)}) == -1 ||
            sql::create_index(db, PARTICIPANTS_TABLE, "challenge_id,join_seq", true) == -1)
            return -1;

        sqlite3_stmt *stmt;
        const std::string_view key = LEDGER_VERSION_KEY;
        const std::string_view value = version::LEDGER_VERSION;
        if (sqlite3_prepare_v2(db, INSERT_META, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, key) &&
            BIND_TEXT(2, value) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error writing ledger version. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Checks whether the stored ledger version is one this build can read.
     * @returns 0 if compatible. -1 if missing, malformed or newer than supported.
     */
    int check_version(sqlite3 *db)
    {
        sqlite3_stmt *stmt;
        const std::string_view key = LEDGER_VERSION_KEY;
        std::string stored_version;

        if (sqlite3_prepare_v2(db, SELECT_META, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, key) &&
            sqlite3_step(stmt) == SQLITE_ROW)
        {
            stored_version = GET_TEXT(0);
        }
        sqlite3_finalize(stmt);

        if (stored_version.empty())
        {
            LOG_ERROR << "Ledger version missing in ledger db.";
            return -1;
        }

        const int res = version::version_compare(stored_version, version::LEDGER_VERSION);
        if (res == -2)
        {
            LOG_ERROR << "Malformed ledger version " << stored_version;
            return -1;
        }
        else if (res == 1)
        {
            LOG_ERROR << "Ledger version " << stored_version << " is newer than supported " << version::LEDGER_VERSION;
            return -1;
        }

        return 0;
    }

    /**
     * Inserts a challenge row together with its whitelist rows.
     */
    int insert_challenge(sqlite3 *db, const challenge_record &challenge)
    {
        sqlite3_stmt *stmt;
        if (!(sqlite3_prepare_v2(db, INSERT_CHALLENGE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
              BIND_U64(1, challenge.id) &&
              BIND_BLOB(2, challenge.creator) &&
              BIND_U64(3, challenge.start_time) &&
              BIND_U64(4, challenge.end_time) &&
              BIND_U64(5, challenge.stake_amount) &&
              BIND_U64(6, challenge.total_staked) &&
              sqlite3_bind_int(stmt, 7, challenge.state) == SQLITE_OK &&
              BIND_OPT_BLOB(8, challenge.winner) &&
              BIND_OPT_BLOB(9, challenge.result_hash) &&
              BIND_U64(10, challenge.participant_count) &&
              sqlite3_step(stmt) == SQLITE_DONE))
        {
            LOG_ERROR << "Error inserting challenge record. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }
        sqlite3_finalize(stmt);

        if (sqlite3_prepare_v2(db, INSERT_WHITELIST, -1, &stmt, 0) != SQLITE_OK || stmt == NULL)
        {
            LOG_ERROR << "Error preparing whitelist insert. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        for (size_t i = 0; i < challenge.whitelist.size(); i++)
        {
            const std::string &identity = challenge.whitelist[i];
            if (!(BIND_U64(1, challenge.id) &&
                  BIND_U64(2, i) &&
                  BIND_BLOB(3, identity) &&
                  sqlite3_step(stmt) == SQLITE_DONE))
            {
                LOG_ERROR << "Error inserting whitelist record. " << sqlite3_errmsg(db);
                sqlite3_finalize(stmt);
                return -1;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }

        sqlite3_finalize(stmt);
        return 0;
    }

    /**
     * Writes the mutable fields of a challenge. Parameters and the whitelist never change after insert.
     */
    int update_challenge(sqlite3 *db, const challenge_record &challenge)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, UPDATE_CHALLENGE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, challenge.total_staked) &&
            sqlite3_bind_int(stmt, 2, challenge.state) == SQLITE_OK &&
            BIND_OPT_BLOB(3, challenge.winner) &&
            BIND_OPT_BLOB(4, challenge.result_hash) &&
            BIND_U64(5, challenge.participant_count) &&
            BIND_U64(6, challenge.id) &&
            sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db) == 1)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error updating challenge " << challenge.id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int insert_participant(sqlite3 *db, const uint64_t challenge_id, const participant_record &participant)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, INSERT_PARTICIPANT, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, challenge_id) &&
            BIND_BLOB(2, participant.identity) &&
            BIND_TEXT(3, participant.correlation_id) &&
            BIND_U64(4, participant.stake) &&
            BIND_U64(5, participant.join_seq) &&
            BIND_U64(6, participant.joined_at) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting participant record. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int update_participant_stake(sqlite3 *db, const uint64_t challenge_id, std::string_view identity, const uint64_t stake)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, UPDATE_PARTICIPANT_STAKE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_U64(1, stake) &&
            BIND_U64(2, challenge_id) &&
            BIND_BLOB(3, identity) &&
            sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db) == 1)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error updating participant stake in challenge " << challenge_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int save_balance(sqlite3 *db, std::string_view identity, const fund_balance &balance)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SAVE_BALANCE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_BLOB(1, identity) &&
            BIND_U64(2, balance.deposited) &&
            BIND_U64(3, balance.released) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error saving fund balance. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int save_attester(sqlite3 *db, const attester_config &attester)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SAVE_ATTESTER, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_BLOB(1, attester.pubkey) &&
            BIND_U64(2, attester.version) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error saving attester config. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int load_whitelist(sqlite3 *db, const uint64_t challenge_id, std::vector<std::string> &whitelist)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_WHITELIST, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_U64(1, challenge_id))
        {
            LOG_ERROR << "Error querying whitelist of challenge " << challenge_id << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int res;
        while ((res = sqlite3_step(stmt)) == SQLITE_ROW)
            whitelist.push_back(GET_BLOB(0));

        sqlite3_finalize(stmt);
        return res == SQLITE_DONE ? 0 : -1;
    }

    /**
     * Loads every challenge in id order along with its whitelist.
     */
    int load_challenges(sqlite3 *db, std::vector<challenge_record> &challenges)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_CHALLENGES, -1, &stmt, 0) != SQLITE_OK || stmt == NULL)
        {
            LOG_ERROR << "Error querying challenges. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int res;
        while ((res = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            challenge_record challenge;
            challenge.id = GET_U64(0);
            challenge.creator = GET_BLOB(1);
            challenge.start_time = GET_U64(2);
            challenge.end_time = GET_U64(3);
            challenge.stake_amount = GET_U64(4);
            challenge.total_staked = GET_U64(5);
            challenge.state = static_cast<CHALLENGE_STATE>(sqlite3_column_int(stmt, 6));
            if (sqlite3_column_type(stmt, 7) != SQLITE_NULL)
                challenge.winner = GET_BLOB(7);
            if (sqlite3_column_type(stmt, 8) != SQLITE_NULL)
                challenge.result_hash = GET_BLOB(8);
            challenge.participant_count = GET_U64(9);
            challenges.push_back(std::move(challenge));
        }
        sqlite3_finalize(stmt);

        if (res != SQLITE_DONE)
        {
            LOG_ERROR << "Error reading challenges. " << sqlite3_errmsg(db);
            return -1;
        }

        for (challenge_record &challenge : challenges)
        {
            if (load_whitelist(db, challenge.id, challenge.whitelist) == -1)
                return -1;
        }

        return 0;
    }

    /**
     * Loads the participants of a challenge in join order.
     */
    int load_participants(sqlite3 *db, const uint64_t challenge_id, std::vector<participant_record> &participants)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_PARTICIPANTS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_U64(1, challenge_id))
        {
            LOG_ERROR << "Error querying participants of challenge " << challenge_id << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int res;
        while ((res = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            participant_record participant;
            participant.identity = GET_BLOB(0);
            participant.correlation_id = GET_TEXT(1);
            participant.stake = GET_U64(2);
            participant.joined = true;
            participant.join_seq = GET_U64(3);
            participant.joined_at = GET_U64(4);
            participants.push_back(std::move(participant));
        }

        sqlite3_finalize(stmt);
        return res == SQLITE_DONE ? 0 : -1;
    }

    int load_balances(sqlite3 *db, std::unordered_map<std::string, fund_balance> &balances)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_BALANCES, -1, &stmt, 0) != SQLITE_OK || stmt == NULL)
        {
            LOG_ERROR << "Error querying balances. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int res;
        while ((res = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            fund_balance &balance = balances[GET_BLOB(0)];
            balance.deposited = GET_U64(1);
            balance.released = GET_U64(2);
        }

        sqlite3_finalize(stmt);
        return res == SQLITE_DONE ? 0 : -1;
    }

    /**
     * @returns 1 if the attester slot is populated. 0 if empty. -1 on error.
     */
    int load_attester(sqlite3 *db, attester_config &attester)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db, SELECT_ATTESTER, -1, &stmt, 0) == SQLITE_OK && stmt != NULL)
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                attester.pubkey = GET_BLOB(0);
                attester.version = GET_U64(1);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying attester config. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

} // namespace ledger::store
