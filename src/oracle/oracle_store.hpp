#ifndef _STC_ORACLE_ORACLE_STORE_
#define _STC_ORACLE_ORACLE_STORE_

#include "../pchheader.hpp"
#include "oracle_common.hpp"

/**
 * sqlite persistence of attestation service state: confirmations, mileage snapshots and locked-in decisions.
 */
namespace oracle::store
{
    int create_schema(sqlite3 *db);

    int insert_confirmation(sqlite3 *db, const uint64_t challenge_id, std::string_view identity, std::string_view signature, const uint64_t confirmed_at);

    int get_confirmed_identities(sqlite3 *db, const uint64_t challenge_id, std::unordered_set<std::string> &identities);

    int insert_snapshot(sqlite3 *db, const mileage_snapshot &snapshot);

    int get_latest_snapshots(sqlite3 *db, const uint64_t challenge_id, std::unordered_map<std::string, mileage_snapshot> &snapshots);

    int save_decision(sqlite3 *db, const decision_record &decision);

    int get_decision(sqlite3 *db, const uint64_t challenge_id, decision_record &decision);

} // namespace oracle::store

#endif
