/**
 * Insurance Contract Implementation. See function bodies for further notes.
 *
 * Policies are paid for from deposits made through eosio.token transfers and
 * paid out of the pool held in config (available_funds).
 */

#include "../include/insurance.hpp"

#pragma region Config_Actions

void insurance::init(name initial_admin) {

    //authenticate
    require_auth(get_self());

    //open config singleton
    config_singleton configs(get_self(), get_self().value);

    //validate
    check_state(!configs.exists(), "contract already initialized");
    check_valid(is_account(initial_admin), "initial admin account doesn't exist");

    //initialize
    config initial_conf;
    initial_conf.admin = initial_admin;
    initial_conf.contract_version = "1.0.0";
    initial_conf.creation_round = current_round();

    //set initial config
    configs.set(initial_conf, get_self());

    //start counters at zero
    stats_singleton stats_s(get_self(), get_self().value);
    stats_s.set(stats{}, get_self());

    log_event(name("initialized"), 0, initial_admin, asset(0, TLOS_SYM));
}

void insurance::setadmin(name new_admin) {
    //open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    auto conf = configs.get();

    //authenticate
    check_authorized(has_auth(conf.admin), "caller is not the admin");

    //validate
    check_valid(is_account(new_admin), "new admin account doesn't exist");

    //change admin
    conf.admin = new_admin;

    //set new config
    configs.set(conf, get_self());
}

void insurance::setconfig(uint32_t min_lead_time, uint32_t min_duration, uint32_t dispute_window)
{
	//open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    auto conf = configs.get();

	//authenticate
	check_authorized(has_auth(conf.admin), "caller is not the admin");

	//Configuration checks
	check_valid(min_lead_time > 0, "policies must start after the current round");
	check_valid(min_duration > 0, "minimum policy duration must be greater than 0");
	check_valid(dispute_window > 0, "dispute window must be greater than 0");

	conf.min_lead_time = min_lead_time;
	conf.min_duration = min_duration;
	conf.dispute_window = dispute_window;

	//set new config
    configs.set(conf, get_self());
}

void insurance::setoracle(name oracle)
{
	//open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    auto conf = configs.get();

	//authenticate
	check_authorized(has_auth(conf.admin), "caller is not the admin");

	//validate
	check_valid(is_account(oracle), "oracle account doesn't exist");

	conf.oracle = oracle;
    configs.set(conf, get_self());
}

void insurance::setdisplink(name dispute_contract)
{
	//open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    auto conf = configs.get();

	//authenticate
	check_authorized(has_auth(conf.admin), "caller is not the admin");

	//validate
	check_valid(is_account(dispute_contract), "dispute contract account doesn't exist");
	check_valid(dispute_contract != get_self(), "dispute contract can't be this contract");

	conf.dispute_contract = dispute_contract;
    configs.set(conf, get_self());
}

#pragma endregion Config_Actions

#pragma region Policy_Actions

uint64_t insurance::newpolicy(name owner, string zip_code, uint64_t t0, uint64_t t1, asset cap,
	uint8_t direction, uint64_t threshold, uint64_t slope, asset fee)
{
	//authenticate
	require_auth(owner);

	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	uint64_t now = current_round();

	//validate
	assert_string(zip_code, "zip code must be between 1 and 254 characters");
	check_valid(t0 < t1, "policy start must be before policy end");
	check_valid(t0 >= now + conf.min_lead_time, "policy start must be in the future");
	check_valid(t1 - t0 >= conf.min_duration, "policy duration is too short");
	check_valid(cap.is_valid() && cap.symbol == TLOS_SYM, "cap must be a valid TLOS amount");
	check_valid(cap.amount > 0, "cap must be positive");
	check_valid(fee.is_valid() && fee.symbol == TLOS_SYM, "fee must be a valid TLOS amount");
	check_valid(fee.amount > 0, "fee must be positive");
	check_valid(direction <= trigger_direction::BELOW_THRESHOLD, "direction must be 0 (above) or 1 (below)");

	//Pay the fee from the owner's deposit into the pool
	sub_balance(owner, fee);
	conf.available_funds += fee;

	uint64_t new_policy_id = conf.next_policy_id;
	conf.next_policy_id += 1;
	configs.set(conf, get_self());

	//open policies table, create the policy
	policies_table policies(get_self(), get_self().value);
	policies.emplace(owner, [&](auto &col) {
		col.policy_id = new_policy_id;
		col.owner = owner;
		col.zip_code = zip_code;
		col.t0 = t0;
		col.t1 = t1;
		col.cap = cap;
		col.direction = direction;
		col.threshold = threshold;
		col.slope = slope;
		col.fee_paid = fee;
		col.settled = static_cast<uint8_t>(settle_status::UNSETTLED);
		col.settled_at = 0;
		col.payout = asset(0, TLOS_SYM);
	});

	update_stats(name("polcreated"), cap, fee);
	log_event(name("polcreated"), new_policy_id, owner, cap);

	return new_policy_id;
}

void insurance::delpolicy(name owner, uint64_t policy_id)
{
	//authenticate
	require_auth(owner);

	//open policies table, get policy
	policies_table policies(get_self(), get_self().value);
	auto pol_itr = policies.find(policy_id);

	//validate
	check_state(pol_itr != policies.end(), "policy not found");
	check_authorized(pol_itr->owner == owner, "only the policy owner can delete it");
	check_state(pol_itr->settled == settle_status::UNSETTLED, "settled policies can't be deleted");

	policies.erase(pol_itr);

	update_stats(name("poldeleted"), asset(0, TLOS_SYM), asset(0, TLOS_SYM));
	log_event(name("poldeleted"), policy_id, owner, asset(0, TLOS_SYM));
}

void insurance::filedispute(name owner, uint64_t policy_id, string reason)
{
	//authenticate
	require_auth(owner);

	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	//open policies table, get policy
	policies_table policies(get_self(), get_self().value);
	auto pol_itr = policies.find(policy_id);

	//validate
	check_state(pol_itr != policies.end(), "policy not found");
	check_authorized(pol_itr->owner == owner, "only the policy owner can file a dispute");
	check_state(pol_itr->settled == settle_status::SETTLED, "policy has not been settled");
	check_state(current_round() <= pol_itr->settled_at + conf.dispute_window, "dispute window has closed");
	check_state(conf.dispute_contract != name(), "dispute contract not linked");
	check_valid(reason.length() < 255, "reason must be shorter than 255 characters");

	//Open the dispute on the linked contract. Any failure there aborts this action too
	action(permission_level{get_self(), name("active")}, conf.dispute_contract, name("opendispute"),
		make_tuple(owner, policy_id, reason))
		.send();

	log_event(name("disputed"), policy_id, owner, asset(0, TLOS_SYM));
}

void insurance::withdraw(name owner)
{
	//authenticate
	require_auth(owner);

	//open accounts table, get balance for the owner
	accounts_table accounts(get_self(), owner.value);
	auto bal_itr = accounts.find(TLOS_SYM.code().raw());
	check_funds(bal_itr != accounts.end() && bal_itr->balance.amount > 0, "balance does not exist");

	asset amount = bal_itr->balance;

	//Transfer funds from the Smart Contract to the owner
	action(permission_level{get_self(), name("active")}, name("eosio.token"), name("transfer"),
		   make_tuple(get_self(),
					  owner,
					  amount,
					  std::string("AgriGuard withdrawal")))
		.send();

	accounts.erase(bal_itr);

	log_event(name("withdrawal"), 0, owner, amount);
}

#pragma endregion Policy_Actions

#pragma region Oracle_Actions

asset insurance::settle(name oracle, uint64_t policy_id, bool approved)
{
	return settle_policy(oracle, policy_id, approved);
}

asset insurance::postdecision(name oracle, settlement_decision decision)
{
	//validate
	check_valid(decision.decision <= 1, "decision must be 0 (reject) or 1 (approve)");

	return settle_policy(oracle, decision.policy_id, decision.decision == 1);
}

#pragma endregion Oracle_Actions

#pragma region Bridge_Actions

void insurance::forcesettle(uint64_t dispute_id, uint64_t policy_id, bool approved)
{
	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	//authenticate
	check_authorized(conf.dispute_contract != name() && has_auth(conf.dispute_contract),
		"only the linked dispute contract can force a settlement");

	bool applied = false;
	asset payout = asset(0, TLOS_SYM);
	string error = "";

	receipts_table receipts(get_self(), get_self().value);
	auto rcpt_itr = receipts.find(dispute_id);

	if (rcpt_itr != receipts.end()) {
		//already applied for this dispute, acknowledge again without paying
		check_valid(rcpt_itr->policy_id == policy_id, "dispute was settled against another policy");
		applied = true;
		payout = rcpt_itr->payout;
	} else {
		policies_table policies(get_self(), get_self().value);
		auto pol_itr = policies.find(policy_id);

		if (pol_itr == policies.end()) {
			error = format_error(error_kind::STATE, "policy not found");
		} else {
			error = settlement_error(*pol_itr, approved, conf);
		}

		if (error.empty()) {
			payout = apply_settlement(policies, *pol_itr, approved, conf);
			configs.set(conf, get_self());

			receipts.emplace(get_self(), [&](auto &col) {
				col.dispute_id = dispute_id;
				col.policy_id = policy_id;
				col.approved = approved;
				col.payout = payout;
				col.applied_at = current_round();
			});

			applied = true;
			log_event(name("bridgeok"), policy_id, conf.dispute_contract, payout);
		} else {
			log_event(name("bridgefail"), policy_id, conf.dispute_contract, asset(0, TLOS_SYM));
		}
	}

	//report the outcome back to the dispute contract
	action(permission_level{get_self(), name("active")}, conf.dispute_contract, name("settleack"),
		make_tuple(dispute_id, applied, payout, error))
		.send();
}

#pragma endregion Bridge_Actions

#pragma region Queries

uint8_t insurance::valtiming(uint64_t policy_id)
{
	policies_table policies(get_self(), get_self().value);
	auto pol_itr = policies.find(policy_id);

	if (pol_itr == policies.end()) {
		return static_cast<uint8_t>(policy_timing::NOT_FOUND);
	}

	if (pol_itr->settled == settle_status::SETTLED) {
		return static_cast<uint8_t>(policy_timing::SETTLED);
	}

	uint64_t now = current_round();

	if (now < pol_itr->t0) {
		return static_cast<uint8_t>(policy_timing::NOT_STARTED);
	}

	if (now > pol_itr->t1) {
		return static_cast<uint8_t>(policy_timing::EXPIRED);
	}

	return static_cast<uint8_t>(policy_timing::ACTIVE);
}

vector<uint64_t> insurance::policiesof(name owner)
{
	policies_table policies(get_self(), get_self().value);
	auto by_owner = policies.get_index<name("byowner")>();

	vector<uint64_t> ids;
	for (auto itr = by_owner.lower_bound(owner.value); itr != by_owner.end() && itr->owner == owner; ++itr) {
		ids.push_back(itr->policy_id);
	}

	return ids;
}

asset insurance::calcfee(asset cap, uint8_t risk_score, uint8_t uncertainty, uint16_t duration_days)
{
	check_valid(cap.is_valid() && cap.symbol == TLOS_SYM, "cap must be a valid TLOS amount");
	check_valid(cap.amount > 0, "cap must be positive");

	//1% of the cap, scaled by the risk, uncertainty and duration multipliers (percentages)
	uint128_t base_fee = static_cast<uint128_t>(cap.amount) / 100;
	uint128_t risk_multiplier = 100 + risk_score / 2;
	uint128_t uncertainty_multiplier = 100 + uncertainty;
	uint128_t duration_multiplier = 100 + duration_days / 2;

	uint128_t fee = base_fee * risk_multiplier * uncertainty_multiplier * duration_multiplier / (100 * 100 * 100);

	//minimum fee of 0.1000 TLOS
	const int64_t min_fee = 1000;
	int64_t amount = fee < static_cast<uint128_t>(min_fee) ? min_fee : static_cast<int64_t>(fee);

	return asset(amount, TLOS_SYM);
}

event_window insurance::recentevents(uint32_t limit)
{
	events_table events(get_self(), get_self().value);
	return recent_window(events, limit);
}

#pragma endregion Queries

#pragma region Helpers

void insurance::assert_string(string to_check, string error_msg)
{
	check_valid(to_check.length() > 0 && to_check.length() < 255, error_msg.c_str());
}

void insurance::sub_balance(name owner, asset value) {
	accounts_table from_acnts(get_self(), owner.value);

	auto from = from_acnts.find(value.symbol.code().raw());
	check_funds(from != from_acnts.end(), "no deposit found");
	check_funds(from->balance.amount >= value.amount, "deposit is below the required amount");

	if (from->balance - value == asset(0, value.symbol))
	{
		from_acnts.erase(from);
	}
	else
	{
		from_acnts.modify(from, same_payer, [&](auto &a) {
			a.balance -= value;
		});
	}
}

void insurance::add_balance(name owner, asset value, name ram_payer) {
	accounts_table to_acnts(get_self(), owner.value);
	auto to = to_acnts.find(value.symbol.code().raw());
	if (to == to_acnts.end())
	{
		to_acnts.emplace(ram_payer, [&](auto &a) {
			a.balance = value;
		});
	}
	else
	{
		to_acnts.modify(to, same_payer, [&](auto &a) {
			a.balance += value;
		});
	}
}

string insurance::settlement_error(const policy &pol, bool approved, const config &conf)
{
	uint64_t now = current_round();

	if (pol.settled == settle_status::SETTLED) {
		return format_error(error_kind::STATE, "policy already settled");
	}
	if (now < pol.t0) {
		return format_error(error_kind::STATE, "policy is not active yet");
	}
	if (now > pol.t1) {
		return format_error(error_kind::STATE, "policy has expired");
	}
	if (approved && conf.available_funds < pol.cap) {
		return format_error(error_kind::RESOURCE, "insufficient funds in the pool");
	}

	return string("");
}

asset insurance::apply_settlement(policies_table &policies, const policy &pol, bool approved, config &conf)
{
	asset payout = approved ? pol.cap : asset(0, TLOS_SYM);

	//Move the payout from the pool to the owner's deposit
	if (approved) {
		conf.available_funds -= payout;
		add_balance(pol.owner, payout, get_self());
	}

	policies.modify(pol, same_payer, [&](auto &col) {
		col.settled = static_cast<uint8_t>(settle_status::SETTLED);
		col.settled_at = current_round();
		col.payout = payout;
	});

	update_stats(name("settled"), payout, asset(0, TLOS_SYM));
	log_event(name("settled"), pol.policy_id, pol.owner, payout);

	return payout;
}

asset insurance::settle_policy(name oracle, uint64_t policy_id, bool approved)
{
	//authenticate
	require_auth(oracle);

	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	check_authorized(conf.oracle != name() && oracle == conf.oracle, "caller is not the oracle");

	//open policies table, get policy
	policies_table policies(get_self(), get_self().value);
	auto pol_itr = policies.find(policy_id);
	check_state(pol_itr != policies.end(), "policy not found");

	//validate, the message already carries its error kind
	string error = settlement_error(*pol_itr, approved, conf);
	check(error.empty(), error);

	asset payout = apply_settlement(policies, *pol_itr, approved, conf);

	//set new config
	configs.set(conf, get_self());

	return payout;
}

void insurance::log_event(name kind, uint64_t policy_id, name actor, asset amount)
{
	events_table events(get_self(), get_self().value);
	uint64_t new_event_id = events.available_primary_key();

	events.emplace(get_self(), [&](auto &col) {
		col.event_id = new_event_id;
		col.kind = kind;
		col.policy_id = policy_id;
		col.actor = actor;
		col.amount = amount;
		col.round = current_round();
	});
}

void insurance::update_stats(name kind, asset amount, asset fee)
{
	stats_singleton stats_s(get_self(), get_self().value);
	auto st = stats_s.get_or_default(stats{});

	if (kind == name("polcreated")) {
		st.total_policies += 1;
		st.total_coverage += amount;
		st.active_policies += 1;
		st.total_fees += fee;
	} else if (kind == name("settled")) {
		st.total_payouts += amount;
		if (st.active_policies > 0) {
			st.active_policies -= 1;
		}
	} else if (kind == name("poldeleted")) {
		if (st.active_policies > 0) {
			st.active_policies -= 1;
		}
	}

	stats_s.set(st, get_self());
}

#pragma endregion Helpers

#pragma region Notification_handlers

void insurance::transfer_handler(name from, name to, asset quantity, string memo) {
	//authenticate
	require_auth(from);

	if (from == get_self()) {
		return;
	}

	check(to == get_self(), "to must be self");
	check_valid(quantity.is_valid(), "Invalid quantity");
	check_valid(quantity.symbol == TLOS_SYM, "only TLOS tokens are accepted by this contract");

	//If a user is sending funds to the Smart Contract with the memo "fund", funds will be added to
	//the pool in config. Otherwise funds will be added to the user's deposit
	if (memo == string("fund")) {
		//open config singleton, get config
		config_singleton configs(get_self(), get_self().value);
		auto conf = configs.get();

		conf.available_funds += quantity;

		configs.set(conf, get_self());
	} else {
		add_balance(from, quantity, get_self());
	}
}

#pragma endregion Notification_handlers
