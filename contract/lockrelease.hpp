#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <string>
#include <vector>

/*/
LockRelease - Cross-Chain Bridge Escrow Contract
Locks deposits (minus a protocol fee) towards the bridge admin and releases funds coming back from the other chain
/*/

using namespace std;
using namespace eosio;

CONTRACT lockrelease : public contract
{
public:
    using contract::contract;

    // === Error Categories === //
    enum class error : uint8_t {
        already_initialized,
        already_exists,
        not_found,
        invalid_action,
        missing_value
    };

    // === Data Structures === //

    // --- Config Table (Singleton) --- //
    // Presence marks the contract as initialized. Written once by initialize.
    TABLE config {
        name owner;
        uint8_t fee_percentage;
    };

    // --- Admin Table (Singleton) --- //
    TABLE admindata {
        name admin_address;
    };

    // --- Pause Table (Singleton) --- //
    TABLE pausestate {
        time_point_sec paused_at;
    };

    // --- Reentrancy Guard Table (Singleton) --- //
    TABLE guardstate {
        name entry_point;
    };

    // --- Last Lock Snapshot (Singleton) --- //
    TABLE lockdata {
        name user_address;
        string dest_token;
        extended_symbol from_token;
        int64_t in_amount;
        int64_t swapped_amount;
        string recipient_address;
        vector<char> dest_chain;
    };

    // --- Token Balances (owned by the token contract) --- //
    struct account {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }

        EOSLIB_SERIALIZE(account, (balance))
    };

    // === Singleton / Multi-index Declarations === //
    typedef singleton<"config"_n, config> config_singleton;
    typedef singleton<"admin"_n, admindata> admin_singleton;
    typedef singleton<"paused"_n, pausestate> pause_singleton;
    typedef singleton<"guard"_n, guardstate> guard_singleton;
    typedef singleton<"lockdata"_n, lockdata> lockdata_singleton;

    typedef multi_index<"accounts"_n, account> accounts_t;

    // === Actions === //
    // -- Governance Actions -- //
    ACTION initialize(const name& owner, const uint8_t& fee_percentage);
    ACTION addadmin(const name& admin);
    ACTION removeadmin();
    ACTION pause();
    ACTION unpause();

    // -- Core Bridge Actions -- //
    ACTION lock(const name& user_address, const extended_symbol& from_token, const string& dest_token, const int64_t& in_amount, const vector<char>& dest_chain, const string& recipient_address);
    ACTION release(const int64_t& amount, const name& user, const extended_symbol& destination_token);

    // -- Internal Actions -- //
    ACTION clearguard();

    // -- Event Actions -- //
    ACTION adminadded(const admindata& admin);
    ACTION adminremoved();
    ACTION pauseevent();
    ACTION unpauseevent();
    ACTION lockevent(const name& user_address, const string& dest_token, const int64_t& in_amount, const int64_t& swapped_amount, const lockdata& snapshot);
    ACTION releaseevent(const name& user, const extended_symbol& destination_token, const int64_t& amount);

    using clearguard_action = action_wrapper<"clearguard"_n, &lockrelease::clearguard>;
    using adminadded_action = action_wrapper<"adminadded"_n, &lockrelease::adminadded>;
    using adminremoved_action = action_wrapper<"adminremoved"_n, &lockrelease::adminremoved>;
    using pauseevent_action = action_wrapper<"pauseevent"_n, &lockrelease::pauseevent>;
    using unpauseevent_action = action_wrapper<"unpauseevent"_n, &lockrelease::unpauseevent>;
    using lockevent_action = action_wrapper<"lockevent"_n, &lockrelease::lockevent>;
    using releaseevent_action = action_wrapper<"releaseevent"_n, &lockrelease::releaseevent>;

    // === Helper Functions === //
    // -- Error Helpers -- //
    static const char* error_name(error code);
    static void check_or_fail(bool pred, error code, const char* message);

    // -- Authorization Helpers -- //
    config get_config();
    void check_owner_auth();
    admindata get_admin();

    // -- Validation Helpers -- //
    void check_not_paused();

    // -- Token Helpers -- //
    static int64_t get_balance(const extended_symbol& token, const name& owner);
    void send_transfer(const extended_symbol& token, const name& from, const name& to, const int64_t& amount, const string& memo);

    /**
     * Holds the reentrancy guard for one lock or release.
     *
     * Acquiring fails while another entry point holds the guard. Releasing
     * queues clearguard behind every inline action the entry point already
     * sent, so the guard stays set until the token transfers have executed.
     */
    class reentrancy_guard {
    public:
        reentrancy_guard(lockrelease& self, const name& entry_point);
        ~reentrancy_guard();

        reentrancy_guard(const reentrancy_guard&) = delete;
        reentrancy_guard& operator=(const reentrancy_guard&) = delete;

    private:
        lockrelease& _self;
    };
};
