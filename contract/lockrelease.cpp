#include "lockrelease.hpp"


/*/
Implementation of the LockRelease contract
Handles bridge governance, the pause switch, and the lock/release transfer protocol
/*/

// === Helper Functions === //
// --- Error Helpers --- //
const char* lockrelease::error_name(error code) {
    switch (code) {
        case error::already_initialized: return "AlreadyInitialized";
        case error::already_exists:      return "AlreadyExists";
        case error::not_found:           return "NotFound";
        case error::invalid_action:      return "InvalidAction";
        case error::missing_value:       return "MissingValue";
    }
    return "Unknown";
}

void lockrelease::check_or_fail(bool pred, error code, const char* message) {
    if (!pred) {
        check(false, string("🌉 ") + error_name(code) + ": " + message);
    }
}

// --- Authorization Helpers --- //
lockrelease::config lockrelease::get_config() {
    config_singleton config_table(get_self(), get_self().value);
    check_or_fail(config_table.exists(), error::missing_value, "contract not initialized");
    return config_table.get();
}

void lockrelease::check_owner_auth() {
    require_auth(get_config().owner);
}

lockrelease::admindata lockrelease::get_admin() {
    admin_singleton admin_table(get_self(), get_self().value);
    check_or_fail(admin_table.exists(), error::missing_value, "no admin set");
    return admin_table.get();
}

// --- Validation Helpers --- //
void lockrelease::check_not_paused() {
    pause_singleton pause_table(get_self(), get_self().value);
    check_or_fail(!pause_table.exists(), error::invalid_action, "contract is paused");
}

// --- Token Helpers --- //
int64_t lockrelease::get_balance(const extended_symbol& token, const name& owner) {
    accounts_t accounts_table(token.get_contract(), owner.value);
    auto account_itr = accounts_table.find(token.get_symbol().code().raw());
    if (account_itr == accounts_table.end()) {
        return 0;
    }
    return account_itr->balance.amount;
}

void lockrelease::send_transfer(const extended_symbol& token, const name& from, const name& to, const int64_t& amount, const string& memo) {
    action(
        permission_level{from, "active"_n},
        token.get_contract(),
        "transfer"_n,
        std::make_tuple(from, to, asset(amount, token.get_symbol()), memo)
    ).send();
}

// --- Reentrancy Guard --- //
lockrelease::reentrancy_guard::reentrancy_guard(lockrelease& self, const name& entry_point) : _self(self) {
    guard_singleton guard_table(_self.get_self(), _self.get_self().value);
    check_or_fail(!guard_table.exists(), error::invalid_action, "reentrant call rejected");
    guard_table.set(guardstate{entry_point}, _self.get_self());
}

lockrelease::reentrancy_guard::~reentrancy_guard() {
    // Runs after the inline transfers sent by the entry point
    clearguard_action clear(_self.get_self(), {_self.get_self(), "active"_n});
    clear.send();
}

// === Governance Actions === //
// --- Initialize Action --- //
ACTION lockrelease::initialize(const name& owner, const uint8_t& fee_percentage) {
    config_singleton config_table(get_self(), get_self().value);
    check_or_fail(!config_table.exists(), error::already_initialized, "contract already initialized");
    check_or_fail(fee_percentage <= 100, error::invalid_action, "fee percentage must be between 0 and 100");

    config_table.set(config{owner, fee_percentage}, get_self());
}

// --- Add Admin Action --- //
ACTION lockrelease::addadmin(const name& admin) {
    check_not_paused();
    check_owner_auth();

    admin_singleton admin_table(get_self(), get_self().value);
    check_or_fail(!admin_table.exists(), error::already_exists, "admin already set");

    admindata data{admin};
    admin_table.set(data, get_self());

    adminadded_action added(get_self(), {get_self(), "active"_n});
    added.send(data);
}

// --- Remove Admin Action --- //
ACTION lockrelease::removeadmin() {
    check_not_paused();
    check_owner_auth();

    admin_singleton admin_table(get_self(), get_self().value);
    check_or_fail(admin_table.exists(), error::not_found, "no admin to remove");
    admin_table.remove();

    adminremoved_action removed(get_self(), {get_self(), "active"_n});
    removed.send();
}

// --- Pause Action --- //
// Exempt from the pause gate so the owner can always toggle it
ACTION lockrelease::pause() {
    check_owner_auth();

    pause_singleton pause_table(get_self(), get_self().value);
    check_or_fail(!pause_table.exists(), error::already_exists, "contract already paused");
    pause_table.set(pausestate{time_point_sec(current_time_point())}, get_self());

    pauseevent_action paused(get_self(), {get_self(), "active"_n});
    paused.send();
}

// --- Unpause Action --- //
ACTION lockrelease::unpause() {
    check_owner_auth();

    pause_singleton pause_table(get_self(), get_self().value);
    check_or_fail(pause_table.exists(), error::not_found, "contract not paused");
    pause_table.remove();

    unpauseevent_action unpaused(get_self(), {get_self(), "active"_n});
    unpaused.send();
}

// === Core Bridge Actions === //
// --- Lock Action --- //
ACTION lockrelease::lock(const name& user_address, const extended_symbol& from_token, const string& dest_token, const int64_t& in_amount, const vector<char>& dest_chain, const string& recipient_address) {
    check_not_paused();
    reentrancy_guard guard(*this, "lock"_n);

    // -- Authorization and Validation -- //
    require_auth(user_address);
    check_or_fail(in_amount >= 1, error::invalid_action, "amount must be at least 1");

    const admindata admin = get_admin();

    const int64_t user_balance = get_balance(from_token, user_address);
    check_or_fail(user_balance >= in_amount, error::invalid_action, "insufficient balance");

    // -- Fee Calculation -- //
    const config cfg = get_config();
    const int64_t fee = static_cast<int64_t>(uint128_t(in_amount) * cfg.fee_percentage / 100);
    const int64_t swapped_amount = in_amount - fee;
    check_or_fail(swapped_amount >= 1, error::invalid_action, "swapped amount must be at least 1");

    // -- Update State Before Transfers -- //
    lockdata snapshot{user_address, dest_token, from_token, in_amount, swapped_amount, recipient_address, dest_chain};
    lockdata_singleton lockdata_table(get_self(), get_self().value);
    lockdata_table.set(snapshot, get_self());

    // -- Transfer Tokens -- //
    send_transfer(from_token, user_address, get_self(), in_amount, "🔒 Lock: " + asset(in_amount, from_token.get_symbol()).to_string());
    // The fee stays with the contract
    send_transfer(from_token, get_self(), admin.admin_address, swapped_amount, "🔒 Lock forward: " + asset(swapped_amount, from_token.get_symbol()).to_string());

    // -- Emit Event -- //
    lockevent_action locked(get_self(), {get_self(), "active"_n});
    locked.send(user_address, dest_token, in_amount, swapped_amount, snapshot);
}

// --- Release Action --- //
// Amount and recipient come from the admin's own accounting of the other chain
ACTION lockrelease::release(const int64_t& amount, const name& user, const extended_symbol& destination_token) {
    check_not_paused();
    reentrancy_guard guard(*this, "release"_n);

    // -- Authorization -- //
    const admindata admin = get_admin();
    require_auth(admin.admin_address);

    // -- Validation -- //
    const int64_t admin_balance = get_balance(destination_token, admin.admin_address);
    check_or_fail(admin_balance >= amount, error::invalid_action, "insufficient admin balance");

    // -- Transfer Tokens -- //
    send_transfer(destination_token, admin.admin_address, user, amount, "💰 Release: " + asset(amount, destination_token.get_symbol()).to_string());

    // -- Emit Event -- //
    releaseevent_action released(get_self(), {get_self(), "active"_n});
    released.send(user, destination_token, amount);
}

// === Internal Actions === //
// --- Clear Guard Action --- //
ACTION lockrelease::clearguard() {
    require_auth(get_self());

    guard_singleton guard_table(get_self(), get_self().value);
    check_or_fail(guard_table.exists(), error::not_found, "reentrancy guard not held");
    guard_table.remove();
}

// === Event Actions === //
// Emitted inline by this contract only; they carry data for off-chain observers and change no state.
ACTION lockrelease::adminadded(const admindata& admin) {
    require_auth(get_self());
}

ACTION lockrelease::adminremoved() {
    require_auth(get_self());
}

ACTION lockrelease::pauseevent() {
    require_auth(get_self());
}

ACTION lockrelease::unpauseevent() {
    require_auth(get_self());
}

ACTION lockrelease::lockevent(const name& user_address, const string& dest_token, const int64_t& in_amount, const int64_t& swapped_amount, const lockdata& snapshot) {
    require_auth(get_self());
}

ACTION lockrelease::releaseevent(const name& user, const extended_symbol& destination_token, const int64_t& amount) {
    require_auth(get_self());
}
