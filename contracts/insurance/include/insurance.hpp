/**
 * Insurance Contract Interface
 *
 * Parametric policies: creation, oracle settlement, payout and dispute filing.
 */

#pragma once
#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <agriguard-common.hpp>

using namespace std;
using namespace eosio;
using namespace agriguard;

CONTRACT insurance : public eosio::contract
{

public:
	using contract::contract;
	static constexpr symbol TLOS_SYM = CORE_SYM;

#pragma region Enums

	enum class settle_status : uint8_t
	{
		UNSETTLED = 0,
		SETTLED = 1,
	};

	friend constexpr bool operator==(const uint8_t &a, const settle_status &b)
	{
		return a == static_cast<uint8_t>(b);
	}

	friend constexpr bool operator!=(const uint8_t &a, const settle_status &b)
	{
		return a != static_cast<uint8_t>(b);
	}

	//which side of the threshold triggers the payout
	enum class trigger_direction : uint8_t
	{
		ABOVE_THRESHOLD = 0,
		BELOW_THRESHOLD = 1,
	};

	friend constexpr bool operator<=(const uint8_t &a, const trigger_direction &b)
	{
		return a <= static_cast<uint8_t>(b);
	}

	//answers of valtiming
	enum class policy_timing : uint8_t
	{
		NOT_FOUND = 0,
		ACTIVE = 1,
		SETTLED = 2,
		NOT_STARTED = 3,
		EXPIRED = 4,
	};

#pragma endregion Enums

#pragma region Config_Actions

	// initialize the contract
	// pre: config table not initialized
	// auth: self
	ACTION init(name initial_admin);

	// set new admin
	// pre: new_admin account exists
	// auth: admin
	ACTION setadmin(name new_admin);

	// set timing parameters
	// auth: admin
	ACTION setconfig(uint32_t min_lead_time, uint32_t min_duration, uint32_t dispute_window);

	// bind the oracle allowed to settle policies
	// auth: admin
	ACTION setoracle(name oracle);

	// link the dispute resolution contract
	// auth: admin
	ACTION setdisplink(name dispute_contract);

#pragma endregion Config_Actions

#pragma region Policy_Actions

	// Creates a new policy, paying the fee from the owner's deposit
	// post: policy stored as UNSETTLED, returns its id
	// auth: owner
	[[eosio::action]] uint64_t newpolicy(name owner, string zip_code, uint64_t t0, uint64_t t1, asset cap,
		uint8_t direction, uint64_t threshold, uint64_t slope, asset fee);

	// Removes an unsettled policy. The fee is not refunded
	// auth: owner
	ACTION delpolicy(name owner, uint64_t policy_id);

	// Files a dispute against the settlement of a policy
	// pre: policy settled, inside the dispute window
	// auth: owner
	ACTION filedispute(name owner, uint64_t policy_id, string reason);

	// Allows the owner to withdraw their funds
	// pre: balance > 0
	// auth: owner
	ACTION withdraw(name owner);

#pragma endregion Policy_Actions

#pragma region Oracle_Actions

	// Settles a policy, paying the cap to the owner when approved
	// pre: policy unsettled and inside [t0, t1]
	// post: returns the payout, zero when rejected
	// auth: oracle
	[[eosio::action]] asset settle(name oracle, uint64_t policy_id, bool approved);

	//Settlement decision as produced by the risk analysis service.
	//Only the decision bit is consumed
	struct settlement_decision
	{
		uint64_t policy_id;
		uint8_t decision;
		asset settlement_amount;
		uint8_t confidence;
		string reasoning;

		EOSLIB_SERIALIZE(settlement_decision, (policy_id)(decision)(settlement_amount)(confidence)(reasoning))
	};

	// auth: oracle
	[[eosio::action]] asset postdecision(name oracle, settlement_decision decision);

#pragma endregion Oracle_Actions

#pragma region Bridge_Actions

	// Final settlement forced by a resolved dispute. Never aborts on a failed
	// precondition, the outcome is reported back through dispute::settleack
	// auth: linked dispute contract
	ACTION forcesettle(uint64_t dispute_id, uint64_t policy_id, bool approved);

#pragma endregion Bridge_Actions

#pragma region Queries

	[[eosio::action]] uint8_t valtiming(uint64_t policy_id);

	[[eosio::action]] vector<uint64_t> policiesof(name owner);

	[[eosio::action]] asset calcfee(asset cap, uint8_t risk_score, uint8_t uncertainty, uint16_t duration_days);

	[[eosio::action]] event_window recentevents(uint32_t limit);

#pragma endregion Queries

#pragma region Tables and Structs

	/**
	 * Insurance policies.
	 * @scope get_self().value
	 * @key policy_id
	 */
	TABLE policy
	{
		uint64_t policy_id;
		name owner;
		string zip_code;
		uint64_t t0;
		uint64_t t1;
		asset cap;
		uint8_t direction;
		uint64_t threshold;
		uint64_t slope;
		asset fee_paid;
		uint8_t settled = static_cast<uint8_t>(settle_status::UNSETTLED);
		uint64_t settled_at = 0;
		asset payout = asset(0, TLOS_SYM);

		uint64_t primary_key() const { return policy_id; }
		uint64_t by_owner() const { return owner.value; }

		EOSLIB_SERIALIZE(policy, (policy_id)(owner)(zip_code)(t0)(t1)(cap)(direction)(threshold)(slope)
			(fee_paid)(settled)(settled_at)(payout))
	};
	typedef multi_index<name("policies"), policy,
		indexed_by<name("byowner"), const_mem_fun<policy, uint64_t, &policy::by_owner>>> policies_table;

	/**
	 * Settlements applied on behalf of a dispute, one per dispute id.
	 * @scope get_self().value
	 * @key dispute_id
	 */
	TABLE receipt
	{
		uint64_t dispute_id;
		uint64_t policy_id;
		bool approved;
		asset payout;
		uint64_t applied_at;

		uint64_t primary_key() const { return dispute_id; }
		EOSLIB_SERIALIZE(receipt, (dispute_id)(policy_id)(approved)(payout)(applied_at))
	};
	typedef multi_index<name("receipts"), receipt> receipts_table;

	/**
	 * Audit trail.
	 * @scope get_self().value
	 * @key event_id
	 */
	TABLE event
	{
		uint64_t event_id;
		name kind;
		uint64_t policy_id;
		name actor;
		asset amount;
		uint64_t round;

		uint64_t primary_key() const { return event_id; }
		EOSLIB_SERIALIZE(event, (event_id)(kind)(policy_id)(actor)(amount)(round))
	};
	typedef multi_index<name("events"), event> events_table;

	TABLE stats
	{
		uint64_t total_policies = 0;
		asset total_coverage = asset(0, TLOS_SYM);
		asset total_payouts = asset(0, TLOS_SYM);
		uint64_t active_policies = 0;
		asset total_fees = asset(0, TLOS_SYM);

		EOSLIB_SERIALIZE(stats, (total_policies)(total_coverage)(total_payouts)(active_policies)(total_fees))
	};
	typedef singleton<name("stats"), stats> stats_singleton;

	/**
	 * Singleton for global config settings.
	 * @scope singleton scope (get_self().value)
	 * @key table name
	 */
	TABLE config
	{
		name admin;
		string contract_version;
		name oracle;
		name dispute_contract;
		uint64_t next_policy_id = 1;
		uint64_t creation_round = 0;
		uint32_t min_lead_time = 1;
		uint32_t min_duration = 100;
		uint32_t dispute_window = 1000;
		asset available_funds = asset(0, TLOS_SYM);

		EOSLIB_SERIALIZE(config, (admin)(contract_version)(oracle)(dispute_contract)(next_policy_id)
			(creation_round)(min_lead_time)(min_duration)(dispute_window)(available_funds))
	};
	typedef singleton<name("config"), config> config_singleton;

	// scope: account name
	TABLE account
	{
		asset balance;

		uint64_t primary_key() const { return balance.symbol.code().raw(); }
		EOSLIB_SERIALIZE(account, (balance))
	};
	typedef multi_index<name("accounts"), account> accounts_table;

#pragma endregion Tables and Structs

#pragma region Helpers

	void assert_string(string to_check, string error_msg);

	void sub_balance(name owner, asset value);

	void add_balance(name owner, asset value, name ram_payer);

	// returns an empty string when the policy can be settled now, otherwise the error
	string settlement_error(const policy &pol, bool approved, const config &conf);

	// marks the policy settled and moves the payout, returns the payout
	asset apply_settlement(policies_table &policies, const policy &pol, bool approved, config &conf);

	asset settle_policy(name oracle, uint64_t policy_id, bool approved);

	void log_event(name kind, uint64_t policy_id, name actor, asset amount);

	void update_stats(name kind, asset amount, asset fee);

#pragma endregion Helpers

#pragma region Notification_handlers

	[[eosio::on_notify("eosio.token::transfer")]] void transfer_handler(name from, name to, asset quantity, string memo);

#pragma endregion Notification_handlers
};
