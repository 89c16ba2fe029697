/**
 * Dispute Contract Implementation. See function bodies for further notes.
 *
 * A dispute is decided by the jurors drawn for it. Once the quorum of votes is
 * reached the majority decides, and an approved dispute forces the settlement
 * of its policy on the insurance contract through the settlements outbox.
 */

#include "../include/dispute.hpp"

#pragma region Config_Actions

void dispute::init(name initial_admin) {

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

    log_event(name("initialized"), 0, initial_admin, 0);
}

void dispute::setadmin(name new_admin) {
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

void dispute::setconfig(uint32_t voting_duration, uint32_t vote_cooldown, uint32_t registration_warmup,
	uint32_t dispute_warmup, uint32_t eligibility_wait, uint8_t jurors_per_dispute, uint8_t quorum,
	uint8_t majority, uint64_t initial_reputation, uint64_t min_reputation, asset min_stake)
{
	//open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    auto conf = configs.get();

	//authenticate
	check_authorized(has_auth(conf.admin), "caller is not the admin");

	//Configuration checks
	check_valid(voting_duration > 0, "voting duration must be greater than 0");
	check_valid(majority > 0, "majority must be greater than 0");
	check_valid(majority <= quorum, "majority can't be greater than the quorum");
	check_valid(quorum <= jurors_per_dispute, "quorum can't be greater than the jurors per dispute");
	check_valid(min_reputation <= initial_reputation, "new jurors must start above the minimum reputation");
	check_valid(min_stake.is_valid() && min_stake.symbol == TLOS_SYM, "stake must be set in TLOS");
	check_valid(min_stake.amount >= 0, "stake can't be negative");

	conf.voting_duration = voting_duration;
	conf.vote_cooldown = vote_cooldown;
	conf.registration_warmup = registration_warmup;
	conf.dispute_warmup = dispute_warmup;
	conf.eligibility_wait = eligibility_wait;
	conf.jurors_per_dispute = jurors_per_dispute;
	conf.quorum = quorum;
	conf.majority = majority;
	conf.initial_reputation = initial_reputation;
	conf.min_reputation = min_reputation;
	conf.min_stake = min_stake;

	//set new config
    configs.set(conf, get_self());
}

void dispute::setinslink(name insurance_contract)
{
	//open config singleton, get config
    config_singleton configs(get_self(), get_self().value);
    auto conf = configs.get();

	//authenticate
	check_authorized(has_auth(conf.admin), "caller is not the admin");

	//validate, an empty name removes the link
	check_valid(insurance_contract == name() || is_account(insurance_contract), "insurance contract account doesn't exist");
	check_valid(insurance_contract != get_self(), "insurance contract can't be this contract");

	conf.insurance_contract = insurance_contract;
    configs.set(conf, get_self());
}

#pragma endregion Config_Actions

#pragma region Juror_Actions

void dispute::regjuror(name juror)
{
	//authenticate
	require_auth(juror);

	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	uint64_t now = current_round();

	//validate
	check_state(now >= conf.creation_round + conf.registration_warmup, "contract initialization period not complete");

	jurors_table jurors(get_self(), get_self().value);
	check_state(jurors.find(juror.value) == jurors.end(), "juror already registered");

	//The stake is recorded, tokens are not locked
	jurors.emplace(juror, [&](auto &col) {
		col.juror = juror;
		col.reputation = conf.initial_reputation;
		col.total_votes = 0;
		col.correct_votes = 0;
		col.registration_round = now;
		col.last_vote_round = 0;
		col.staked_amount = conf.min_stake;
	});

	update_stats(name("jurorreg"));
	log_event(name("jurorreg"), 0, juror, conf.min_stake.amount);
}

uint64_t dispute::newdispute(name juror, uint64_t policy_id, string reason)
{
	//authenticate
	require_auth(juror);

	jurors_table jurors(get_self(), get_self().value);
	check_authorized(jurors.find(juror.value) != jurors.end(), "caller is not a registered juror");

	return create_dispute(juror, policy_id, reason);
}

void dispute::opendispute(name claimant, uint64_t policy_id, string reason)
{
	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	//authenticate
	check_authorized(conf.insurance_contract != name() && has_auth(conf.insurance_contract),
		"only the linked insurance contract can open disputes for policy owners");

	create_dispute(claimant, policy_id, reason);
}

void dispute::vote(name juror, uint64_t dispute_id, bool approve)
{
	//authenticate
	require_auth(juror);

	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	uint64_t now = current_round();

	//open disputes table, get dispute
	disputes_table disputes(get_self(), get_self().value);
	auto disp_itr = disputes.find(dispute_id);

	//validate
	check_state(disp_itr != disputes.end(), "dispute not found");
	check_state(now <= disp_itr->voting_deadline, "voting period has expired");
	check_state(disp_itr->status == dispute_status::ACTIVE, "dispute already resolved");

	assignments_table assignments(get_self(), dispute_id);
	check_authorized(assignments.find(juror.value) != assignments.end(), "juror is not assigned to this dispute");

	votes_table votes(get_self(), dispute_id);
	check_state(votes.find(juror.value) == votes.end(), "juror already voted on this dispute");

	jurors_table jurors(get_self(), get_self().value);
	const auto &jur = jurors.get(juror.value, "StateError: juror not registered");
	check_state(jur.total_votes == 0 || now - jur.last_vote_round >= conf.vote_cooldown,
		"juror must wait before voting again");

	//Record the vote
	votes.emplace(juror, [&](auto &col) {
		col.juror = juror;
		col.dispute_id = dispute_id;
		col.vote = approve;
		col.timestamp = now;
	});

	disputes.modify(disp_itr, same_payer, [&](auto &col) {
		if (approve) {
			col.yes_votes += 1;
		} else {
			col.no_votes += 1;
		}
		col.total_votes += 1;
	});

	jurors.modify(jur, same_payer, [&](auto &col) {
		col.total_votes += 1;
		col.last_vote_round = now;
	});

	update_stats(name("votecast"));
	log_event(name("votecast"), dispute_id, juror, approve ? 1 : 0);

	//The quorum decides the dispute
	if (disp_itr->total_votes >= conf.quorum) {
		resolve_dispute(disputes, *disp_itr, conf);
	}
}

void dispute::archive(uint64_t dispute_id)
{
	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	//authenticate
	check_authorized(has_auth(conf.admin), "caller is not the admin");

	//open disputes table, get dispute
	disputes_table disputes(get_self(), get_self().value);
	auto disp_itr = disputes.find(dispute_id);

	//validate
	check_state(disp_itr != disputes.end(), "dispute not found");
	check_state(disp_itr->status == dispute_status::APPROVED || disp_itr->status == dispute_status::REJECTED,
		"only approved or rejected disputes can be archived");

	disputes.modify(disp_itr, same_payer, [&](auto &col) {
		col.status = static_cast<uint8_t>(dispute_status::PROCESSED);
	});

	log_event(name("processed"), dispute_id, conf.admin, 0);
}

#pragma endregion Juror_Actions

#pragma region Bridge_Actions

void dispute::settleack(uint64_t dispute_id, bool applied, asset payout, string error)
{
	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	//authenticate
	check_authorized(conf.insurance_contract != name() && has_auth(conf.insurance_contract),
		"only the linked insurance contract can acknowledge settlements");

	//open settlements table, get the outbox row
	settlements_table settlements(get_self(), get_self().value);
	auto stl_itr = settlements.find(dispute_id);
	check_state(stl_itr != settlements.end(), "settlement not found");

	settlements.modify(stl_itr, same_payer, [&](auto &col) {
		col.status = static_cast<uint8_t>(applied ? settlement_status::APPLIED : settlement_status::FAILED);
		col.payout = payout;
		col.last_error = error;
		col.updated_at = current_round();
	});

	log_event(applied ? name("settleok") : name("settlefail"), dispute_id, conf.insurance_contract,
		static_cast<uint64_t>(payout.amount));
}

void dispute::retrysettle(name caller, uint64_t dispute_id)
{
	//authenticate
	require_auth(caller);

	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	//open settlements table, get the outbox row
	settlements_table settlements(get_self(), get_self().value);
	auto stl_itr = settlements.find(dispute_id);

	//validate
	check_state(stl_itr != settlements.end(), "settlement not found");
	check_state(stl_itr->status != settlement_status::APPLIED, "settlement already applied");
	check_state(stl_itr->status == settlement_status::FAILED, "settlement is still pending");

	string link_error = bridge_error(conf);
	check_state(link_error.empty(), link_error.c_str());

	settlements.modify(stl_itr, same_payer, [&](auto &col) {
		col.status = static_cast<uint8_t>(settlement_status::PENDING);
		col.attempts += 1;
		col.updated_at = current_round();
	});

	send_forcesettle(conf, dispute_id, stl_itr->policy_id, stl_itr->approved);
}

#pragma endregion Bridge_Actions

#pragma region Queries

uint8_t dispute::disputestat(uint64_t dispute_id)
{
	//open disputes table, get dispute
	disputes_table disputes(get_self(), get_self().value);
	auto disp_itr = disputes.find(dispute_id);
	check_state(disp_itr != disputes.end(), "dispute not found");

	//An active dispute past its deadline expires on read
	if (disp_itr->status == dispute_status::ACTIVE && current_round() > disp_itr->voting_deadline) {
		disputes.modify(disp_itr, same_payer, [&](auto &col) {
			col.status = static_cast<uint8_t>(dispute_status::EXPIRED);
			col.resolution_round = current_round();
		});

		update_stats(name("expired"));
		log_event(name("expired"), dispute_id, get_self(), disp_itr->total_votes);
	}

	return disp_itr->status;
}

uint8_t dispute::valjuror(name juror)
{
	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	jurors_table jurors(get_self(), get_self().value);
	auto jur_itr = jurors.find(juror.value);

	if (jur_itr == jurors.end()) {
		return static_cast<uint8_t>(juror_eligibility::NOT_REGISTERED);
	}

	if (current_round() - jur_itr->registration_round < conf.eligibility_wait) {
		return static_cast<uint8_t>(juror_eligibility::TOO_NEW);
	}

	if (jur_itr->reputation < conf.min_reputation) {
		return static_cast<uint8_t>(juror_eligibility::LOW_REPUTATION);
	}

	return static_cast<uint8_t>(juror_eligibility::ELIGIBLE);
}

event_window dispute::recentevents(uint32_t limit)
{
	events_table events(get_self(), get_self().value);
	return recent_window(events, limit);
}

dispute::dispute_tally dispute::activedisp()
{
	stats_singleton stats_s(get_self(), get_self().value);
	auto st = stats_s.get_or_default(stats{});

	return dispute_tally{st.active_disputes, st.total_disputes};
}

#pragma endregion Queries

#pragma region Helpers

uint64_t dispute::create_dispute(name claimant, uint64_t policy_id, string reason)
{
	//open config singleton, get config
	config_singleton configs(get_self(), get_self().value);
	auto conf = configs.get();

	uint64_t now = current_round();

	//validate
	check_valid(reason.length() < 255, "reason must be shorter than 255 characters");
	check_state(now >= conf.creation_round + conf.dispute_warmup, "contract initialization period not complete");
	check_state(conf.insurance_contract != name(), "insurance contract not linked");

	//The policy lives on the insurance contract, read only
	insurance_iface::policies_table policies(conf.insurance_contract, conf.insurance_contract.value);
	check_state(policies.find(policy_id) != policies.end(), "policy not found");

	uint64_t new_dispute_id = conf.next_dispute_id;

	//Draw the jurors, the claimant never judges their own dispute
	jurors_table jurors(get_self(), get_self().value);
	auto selected = select_jurors(jurors, new_dispute_id, now, claimant, conf.jurors_per_dispute);
	check_state(selected.size() >= conf.quorum, "not enough jurors available");

	conf.next_dispute_id += 1;
	configs.set(conf, get_self());

	disputes_table disputes(get_self(), get_self().value);
	disputes.emplace(get_self(), [&](auto &col) {
		col.dispute_id = new_dispute_id;
		col.policy_id = policy_id;
		col.claimant = claimant;
		col.reason = reason.empty() ? string("Policy settlement dispute") : reason;
		col.created_at = now;
		col.status = static_cast<uint8_t>(dispute_status::ACTIVE);
		col.yes_votes = 0;
		col.no_votes = 0;
		col.total_votes = 0;
		col.voting_deadline = now + conf.voting_duration;
		col.resolution_round = 0;
	});

	assignments_table assignments(get_self(), new_dispute_id);
	for (const auto &sel : selected) {
		assignments.emplace(get_self(), [&](auto &col) {
			col.juror = sel.juror;
			col.rank = sel.rank;
		});
	}

	update_stats(name("dispcreated"));
	log_event(name("dispcreated"), new_dispute_id, claimant, policy_id);

	return new_dispute_id;
}

void dispute::resolve_dispute(disputes_table &disputes, const dispute_record &disp, const config &conf)
{
	bool approved = disp.yes_votes >= conf.majority;
	uint64_t now = current_round();

	disputes.modify(disp, same_payer, [&](auto &col) {
		col.status = static_cast<uint8_t>(approved ? dispute_status::APPROVED : dispute_status::REJECTED);
		col.resolution_round = now;
	});

	//Jurors on the winning side gain reputation, the others lose it
	votes_table votes(get_self(), disp.dispute_id);
	jurors_table jurors(get_self(), get_self().value);
	for (auto itr = votes.begin(); itr != votes.end(); ++itr) {
		auto jur_itr = jurors.find(itr->juror.value);
		if (jur_itr == jurors.end()) {
			continue;
		}

		bool correct = itr->vote == approved;
		jurors.modify(jur_itr, same_payer, [&](auto &col) {
			if (correct) {
				col.correct_votes += 1;
				col.reputation += 1;
			} else if (col.reputation > 0) {
				col.reputation -= 1;
			}
		});
	}

	name outcome = approved ? name("approved") : name("rejected");
	update_stats(outcome);
	log_event(outcome, disp.dispute_id, get_self(), disp.yes_votes);

	if (approved) {
		trigger_settlement(disp, conf);
	}
}

void dispute::trigger_settlement(const dispute_record &disp, const config &conf)
{
	//A forcesettle the insurance contract would refuse aborts this vote as well,
	//so the link is checked here and a broken one is only recorded
	string link_error = bridge_error(conf);
	bool sendable = link_error.empty();

	settlements_table settlements(get_self(), get_self().value);
	settlements.emplace(get_self(), [&](auto &col) {
		col.dispute_id = disp.dispute_id;
		col.policy_id = disp.policy_id;
		col.approved = true;
		col.status = static_cast<uint8_t>(sendable ? settlement_status::PENDING : settlement_status::FAILED);
		col.attempts = sendable ? 1 : 0;
		col.payout = asset(0, TLOS_SYM);
		col.last_error = link_error;
		col.updated_at = current_round();
	});

	if (!sendable) {
		log_event(name("settlefail"), disp.dispute_id, get_self(), 0);
		return;
	}

	send_forcesettle(conf, disp.dispute_id, disp.policy_id, true);
}

string dispute::bridge_error(const config &conf)
{
	if (conf.insurance_contract == name()) {
		return string("insurance contract not linked");
	}

	//forcesettle only accepts the dispute contract named in the insurance config
	insurance_iface::config_singleton ins_configs(conf.insurance_contract, conf.insurance_contract.value);
	if (!ins_configs.exists() || ins_configs.get().dispute_contract != get_self()) {
		return string("insurance contract does not link back");
	}

	return string("");
}

void dispute::send_forcesettle(const config &conf, uint64_t dispute_id, uint64_t policy_id, bool approved)
{
	//the outcome comes back through settleack
	action(permission_level{get_self(), name("active")}, conf.insurance_contract, name("forcesettle"),
		make_tuple(dispute_id, policy_id, approved))
		.send();
}

void dispute::log_event(name kind, uint64_t dispute_id, name actor, uint64_t value)
{
	events_table events(get_self(), get_self().value);
	uint64_t new_event_id = events.available_primary_key();

	events.emplace(get_self(), [&](auto &col) {
		col.event_id = new_event_id;
		col.kind = kind;
		col.dispute_id = dispute_id;
		col.actor = actor;
		col.value = value;
		col.round = current_round();
	});
}

void dispute::update_stats(name kind)
{
	stats_singleton stats_s(get_self(), get_self().value);
	auto st = stats_s.get_or_default(stats{});

	if (kind == name("jurorreg")) {
		st.active_jurors += 1;
	} else if (kind == name("dispcreated")) {
		st.total_disputes += 1;
		st.active_disputes += 1;
	} else if (kind == name("votecast")) {
		st.total_votes_cast += 1;
	} else if (kind == name("approved")) {
		st.resolved_disputes += 1;
	} else if (kind == name("rejected")) {
		st.rejected_disputes += 1;
	} else if (kind == name("expired")) {
		st.expired_disputes += 1;
	}

	//every outcome closes the dispute for voting
	if (kind == name("approved") || kind == name("rejected") || kind == name("expired")) {
		if (st.active_disputes > 0) {
			st.active_disputes -= 1;
		}
	}

	stats_s.set(st, get_self());
}

#pragma endregion Helpers
