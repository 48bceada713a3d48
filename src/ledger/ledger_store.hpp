#ifndef _STC_LEDGER_LEDGER_STORE_
#define _STC_LEDGER_LEDGER_STORE_

#include "../pchheader.hpp"
#include "ledger_common.hpp"

/**
 * sqlite persistence of the settlement ledger. Callers group the row writes of one operation inside a single
 * transaction using the util::sqlite transaction helpers.
 */
namespace ledger::store
{
    int create_schema(sqlite3 *db);

    int check_version(sqlite3 *db);

    int insert_challenge(sqlite3 *db, const challenge_record &challenge);

    int update_challenge(sqlite3 *db, const challenge_record &challenge);

    int insert_participant(sqlite3 *db, const uint64_t challenge_id, const participant_record &participant);

    int update_participant_stake(sqlite3 *db, const uint64_t challenge_id, std::string_view identity, const uint64_t stake);

    int save_balance(sqlite3 *db, std::string_view identity, const fund_balance &balance);

    int save_attester(sqlite3 *db, const attester_config &attester);

    int load_whitelist(sqlite3 *db, const uint64_t challenge_id, std::vector<std::string> &whitelist);

    int load_challenges(sqlite3 *db, std::vector<challenge_record> &challenges);

    int load_participants(sqlite3 *db, const uint64_t challenge_id, std::vector<participant_record> &participants);

    int load_balances(sqlite3 *db, std::unordered_map<std::string, fund_balance> &balances);

    int load_attester(sqlite3 *db, attester_config &attester);

} // namespace ledger::store

#endif
