/**
 * Dispute Contract Interface
 *
 * Juror registry, juror voting on disputed policy settlements and the
 * settlement outbox towards the insurance contract.
 */

#pragma once
#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <agriguard-common.hpp>
#include "insurance-interface.hpp"
#include "juror-selector.hpp"

using namespace std;
using namespace eosio;
using namespace agriguard;

CONTRACT dispute : public eosio::contract
{

public:
	using contract::contract;
	static constexpr symbol TLOS_SYM = CORE_SYM;

#pragma region Enums

	enum class dispute_status : uint8_t
	{
		ACTIVE = 0,
		APPROVED = 1,
		REJECTED = 2,
		EXPIRED = 3,
		PROCESSED = 4,
	};

	friend constexpr bool operator==(const uint8_t &a, const dispute_status &b)
	{
		return a == static_cast<uint8_t>(b);
	}

	friend constexpr bool operator!=(const uint8_t &a, const dispute_status &b)
	{
		return a != static_cast<uint8_t>(b);
	}

	//state of a bridge call in the settlements outbox
	enum class settlement_status : uint8_t
	{
		PENDING = 0,
		APPLIED = 1,
		FAILED = 2,
	};

	friend constexpr bool operator==(const uint8_t &a, const settlement_status &b)
	{
		return a == static_cast<uint8_t>(b);
	}

	friend constexpr bool operator!=(const uint8_t &a, const settlement_status &b)
	{
		return a != static_cast<uint8_t>(b);
	}

	//answers of valjuror
	enum class juror_eligibility : uint8_t
	{
		NOT_REGISTERED = 0,
		TOO_NEW = 1,
		LOW_REPUTATION = 2,
		ELIGIBLE = 3,
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

	// set voting parameters
	// pre: 0 < majority <= quorum <= jurors_per_dispute
	// auth: admin
	ACTION setconfig(uint32_t voting_duration, uint32_t vote_cooldown, uint32_t registration_warmup,
		uint32_t dispute_warmup, uint32_t eligibility_wait, uint8_t jurors_per_dispute, uint8_t quorum,
		uint8_t majority, uint64_t initial_reputation, uint64_t min_reputation, asset min_stake);

	// link the insurance contract, an empty name unlinks it
	// auth: admin
	ACTION setinslink(name insurance_contract);

#pragma endregion Config_Actions

#pragma region Juror_Actions

	// Registers the caller as a juror
	// pre: registration warm-up elapsed, not registered yet
	// auth: juror
	ACTION regjuror(name juror);

	// Opens a dispute on a policy of the linked insurance contract, returns its id
	// auth: registered juror
	[[eosio::action]] uint64_t newdispute(name juror, uint64_t policy_id, string reason);

	// Opens a dispute on behalf of a policy owner
	// auth: linked insurance contract
	ACTION opendispute(name claimant, uint64_t policy_id, string reason);

	// Casts the vote of an assigned juror, resolving the dispute once the quorum is reached
	// auth: juror
	ACTION vote(name juror, uint64_t dispute_id, bool approve);

	// Moves a resolved dispute to PROCESSED
	// auth: admin
	ACTION archive(uint64_t dispute_id);

#pragma endregion Juror_Actions

#pragma region Bridge_Actions

	// Result of insurance::forcesettle for a dispute
	// auth: linked insurance contract
	ACTION settleack(uint64_t dispute_id, bool applied, asset payout, string error);

	// Sends a failed settlement again
	// auth: caller
	ACTION retrysettle(name caller, uint64_t dispute_id);

#pragma endregion Bridge_Actions

#pragma region Queries

	// Returns the status of a dispute, expiring it first when its deadline has passed
	[[eosio::action]] uint8_t disputestat(uint64_t dispute_id);

	[[eosio::action]] uint8_t valjuror(name juror);

	[[eosio::action]] event_window recentevents(uint32_t limit);

	//reply of activedisp
	struct dispute_tally
	{
		uint64_t active;
		uint64_t total;

		EOSLIB_SERIALIZE(dispute_tally, (active)(total))
	};

	// Returns the number of disputes still open for voting and the number ever created
	[[eosio::action]] dispute_tally activedisp();

#pragma endregion Queries

#pragma region Tables and Structs

	/**
	 * Disputes.
	 * @scope get_self().value
	 * @key dispute_id
	 */
	TABLE dispute_record
	{
		uint64_t dispute_id;
		uint64_t policy_id;
		name claimant;
		string reason;
		uint64_t created_at;
		uint8_t status = static_cast<uint8_t>(dispute_status::ACTIVE);
		uint64_t yes_votes = 0;
		uint64_t no_votes = 0;
		uint64_t total_votes = 0;
		uint64_t voting_deadline;
		uint64_t resolution_round = 0;

		uint64_t primary_key() const { return dispute_id; }
		uint64_t by_policy() const { return policy_id; }

		EOSLIB_SERIALIZE(dispute_record, (dispute_id)(policy_id)(claimant)(reason)(created_at)(status)
			(yes_votes)(no_votes)(total_votes)(voting_deadline)(resolution_round))
	};
	typedef multi_index<name("disputes"), dispute_record,
		indexed_by<name("bypolicy"), const_mem_fun<dispute_record, uint64_t, &dispute_record::by_policy>>> disputes_table;

	/**
	 * Registered jurors.
	 * @scope get_self().value
	 * @key juror.value
	 */
	TABLE juror_info
	{
		name juror;
		uint64_t reputation;
		uint64_t total_votes = 0;
		uint64_t correct_votes = 0;
		uint64_t registration_round;
		uint64_t last_vote_round = 0;
		asset staked_amount;

		uint64_t primary_key() const { return juror.value; }
		EOSLIB_SERIALIZE(juror_info, (juror)(reputation)(total_votes)(correct_votes)(registration_round)
			(last_vote_round)(staked_amount))
	};
	typedef multi_index<name("jurors"), juror_info> jurors_table;

	/**
	 * Jurors drawn for a dispute.
	 * @scope dispute_id
	 * @key juror.value
	 */
	TABLE assignment
	{
		name juror;
		uint64_t rank;

		uint64_t primary_key() const { return juror.value; }
		EOSLIB_SERIALIZE(assignment, (juror)(rank))
	};
	typedef multi_index<name("assignments"), assignment> assignments_table;

	/**
	 * Votes, write-once.
	 * @scope dispute_id
	 * @key juror.value
	 */
	TABLE ballot
	{
		name juror;
		uint64_t dispute_id;
		bool vote;
		uint64_t timestamp;

		uint64_t primary_key() const { return juror.value; }
		EOSLIB_SERIALIZE(ballot, (juror)(dispute_id)(vote)(timestamp))
	};
	typedef multi_index<name("votes"), ballot> votes_table;

	/**
	 * Settlement outbox, one row per approved dispute.
	 * @scope get_self().value
	 * @key dispute_id
	 */
	TABLE settlement
	{
		uint64_t dispute_id;
		uint64_t policy_id;
		bool approved;
		uint8_t status = static_cast<uint8_t>(settlement_status::PENDING);
		uint32_t attempts = 0;
		asset payout;
		string last_error;
		uint64_t updated_at;

		uint64_t primary_key() const { return dispute_id; }
		EOSLIB_SERIALIZE(settlement, (dispute_id)(policy_id)(approved)(status)(attempts)(payout)(last_error)(updated_at))
	};
	typedef multi_index<name("settlements"), settlement> settlements_table;

	/**
	 * Audit trail.
	 * @scope get_self().value
	 * @key event_id
	 */
	TABLE event
	{
		uint64_t event_id;
		name kind;
		uint64_t dispute_id;
		name actor;
		uint64_t value;
		uint64_t round;

		uint64_t primary_key() const { return event_id; }
		EOSLIB_SERIALIZE(event, (event_id)(kind)(dispute_id)(actor)(value)(round))
	};
	typedef multi_index<name("events"), event> events_table;

	TABLE stats
	{
		uint64_t total_disputes = 0;
		uint64_t active_disputes = 0;
		uint64_t resolved_disputes = 0;
		uint64_t rejected_disputes = 0;
		uint64_t expired_disputes = 0;
		uint64_t total_votes_cast = 0;
		uint64_t active_jurors = 0;

		EOSLIB_SERIALIZE(stats, (total_disputes)(active_disputes)(resolved_disputes)(rejected_disputes)(expired_disputes)
			(total_votes_cast)(active_jurors))
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
		name insurance_contract;
		uint64_t next_dispute_id = 1;
		uint64_t creation_round = 0;
		uint32_t voting_duration = 1000;
		uint32_t vote_cooldown = 10;
		uint32_t registration_warmup = 10;
		uint32_t dispute_warmup = 50;
		uint32_t eligibility_wait = 50;
		uint8_t jurors_per_dispute = 10;
		uint8_t quorum = 7;
		uint8_t majority = 4;
		uint64_t initial_reputation = 100;
		uint64_t min_reputation = 10;
		asset min_stake = asset(10000, TLOS_SYM);

		EOSLIB_SERIALIZE(config, (admin)(contract_version)(insurance_contract)(next_dispute_id)(creation_round)
			(voting_duration)(vote_cooldown)(registration_warmup)(dispute_warmup)(eligibility_wait)
			(jurors_per_dispute)(quorum)(majority)(initial_reputation)(min_reputation)(min_stake))
	};
	typedef singleton<name("config"), config> config_singleton;

#pragma endregion Tables and Structs

#pragma region Helpers

	uint64_t create_dispute(name claimant, uint64_t policy_id, string reason);

	void resolve_dispute(disputes_table &disputes, const dispute_record &disp, const config &conf);

	void trigger_settlement(const dispute_record &disp, const config &conf);

	// returns an empty string when forcesettle can be sent to the insurance contract
	string bridge_error(const config &conf);

	void send_forcesettle(const config &conf, uint64_t dispute_id, uint64_t policy_id, bool approved);

	void log_event(name kind, uint64_t dispute_id, name actor, uint64_t value);

	void update_stats(name kind);

#pragma endregion Helpers
};
