#include "agriguard_tester.hpp"

#include <fc/crypto/sha256.hpp>

#include <algorithm>
#include <cstring>

using namespace agriguard_test;

namespace {

bool contains(const vector<name>& names, name n) {
   return std::find(names.begin(), names.end(), n) != names.end();
}

//first 8 bytes of sha256(dispute_id || round || juror), read big-endian
uint64_t draw_rank(uint64_t dispute_id, uint64_t round, name juror) {
   char buf[3 * sizeof(uint64_t)];
   uint64_t juror_value = juror.to_uint64_t();
   memcpy(buf, &dispute_id, sizeof(uint64_t));
   memcpy(buf + sizeof(uint64_t), &round, sizeof(uint64_t));
   memcpy(buf + 2 * sizeof(uint64_t), &juror_value, sizeof(uint64_t));

   auto digest = fc::sha256::hash(buf, sizeof(buf));
   const unsigned char* bytes = reinterpret_cast<const unsigned char*>(digest.data());

   uint64_t rank = 0;
   for (int i = 0; i < 8; ++i) {
      rank = (rank << 8) | bytes[i];
   }
   return rank;
}

}

BOOST_AUTO_TEST_SUITE(dispute_tests)

BOOST_FIXTURE_TEST_CASE( regjuror_warmup_and_uniqueness, agriguard_tester ) try {
   const name juror = "jurora"_n;

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: contract initialization period not complete"), regjuror(juror) );

   skip_seconds(11);
   BOOST_REQUIRE_EQUAL( success(), regjuror(juror) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: juror already registered"), regjuror(juror) );

   auto jur = get_juror(juror);
   BOOST_REQUIRE_EQUAL( 100u, jur["reputation"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 0u, jur["total_votes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 0u, jur["correct_votes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( "1.0000 TLOS", jur["staked_amount"].as<asset>().to_string() );

   BOOST_REQUIRE_EQUAL( 1u, get_dispute_stats()["active_jurors"].as_uint64() );
   BOOST_REQUIRE_EQUAL( "jurorreg"_n, get_dispute_event(1)["kind"].as<name>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( newdispute_requirements, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   const name claimant = "jurora"_n;

   skip_seconds(11);
   BOOST_REQUIRE_EQUAL( success(), regjuror(claimant) );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("AuthorizationError: caller is not a registered juror"),
      newdispute(ALICE, pid, "wrong reading") );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: contract initialization period not complete"),
      newdispute(claimant, pid, "wrong reading") );

   skip_seconds(50);

   //the claimant is the only juror and can't judge their own dispute
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: not enough jurors available"),
      newdispute(claimant, pid, "wrong reading") );

   for (auto juror : jurors) {
      if (juror != claimant) {
         BOOST_REQUIRE_EQUAL( success(), regjuror(juror) );
      }
   }

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: policy not found"), newdispute(claimant, 99, "wrong reading") );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("ValidationError: reason must be shorter than 255 characters"),
      newdispute(claimant, pid, string(255, 'x')) );

   uint64_t created = now();
   BOOST_REQUIRE_EQUAL( 1u, query<uint64_t>(DISPUTE, "newdispute"_n, mvo()
      ("juror", claimant)("policy_id", pid)("reason", ""), claimant) );

   auto disp = get_dispute(1);
   BOOST_REQUIRE( !disp.is_null() );
   BOOST_REQUIRE_EQUAL( pid, disp["policy_id"].as_uint64() );
   BOOST_REQUIRE_EQUAL( claimant, disp["claimant"].as<name>() );
   BOOST_REQUIRE_EQUAL( "Policy settlement dispute", disp["reason"].as_string() );
   BOOST_REQUIRE_EQUAL( ACTIVE, disp["status"].as<uint8_t>() );
   BOOST_REQUIRE_EQUAL( created, disp["created_at"].as_uint64() );
   BOOST_REQUIRE_EQUAL( created + 1000, disp["voting_deadline"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 0u, disp["total_votes"].as_uint64() );

   auto assigned = assigned_jurors(1);
   BOOST_REQUIRE_EQUAL( 10u, assigned.size() );
   BOOST_REQUIRE( !contains(assigned, claimant) );

   BOOST_REQUIRE_EQUAL( 1u, get_dispute_stats()["total_disputes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 2u, get_dispute_config()["next_dispute_id"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( vote_checks, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   register_jurors();
   uint64_t did = open_dispute(pid);
   auto assigned = assigned_jurors(did);

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: dispute not found"), vote(assigned[0], 99, true) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("AuthorizationError: juror is not assigned to this dispute"),
      vote("jurora"_n, did, true) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("AuthorizationError: juror is not assigned to this dispute"),
      vote(ALICE, did, true) );
   BOOST_REQUIRE_EQUAL( error("missing authority of " + assigned[0].to_string()),
      push(DISPUTE, BOB, "vote"_n, mvo()("juror", assigned[0])("dispute_id", did)("approve", true)) );

   BOOST_REQUIRE_EQUAL( success(), vote(assigned[0], did, true) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: juror already voted on this dispute"), vote(assigned[0], did, false) );

   auto ballot = get_vote(did, assigned[0]);
   BOOST_REQUIRE_EQUAL( true, ballot["vote"].as_bool() );
   BOOST_REQUIRE_EQUAL( did, ballot["dispute_id"].as_uint64() );

   //counters always add up
   for (uint32_t i = 1; i < 5; ++i) {
      BOOST_REQUIRE_EQUAL( success(), vote(assigned[i], did, i % 2 == 0) );

      auto disp = get_dispute(did);
      BOOST_REQUIRE_EQUAL( i + 1, disp["total_votes"].as_uint64() );
      BOOST_REQUIRE_EQUAL( disp["total_votes"].as_uint64(), disp["yes_votes"].as_uint64() + disp["no_votes"].as_uint64() );
      BOOST_REQUIRE_EQUAL( ACTIVE, disp["status"].as<uint8_t>() );
   }

   auto jur = get_juror(assigned[0]);
   BOOST_REQUIRE_EQUAL( 1u, jur["total_votes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 5u, get_dispute_stats()["total_votes_cast"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( quorum_with_four_yes_approves, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   register_jurors();
   uint64_t did = open_dispute(pid);

   auto voters = cast_votes(did, 4, 3);

   auto disp = get_dispute(did);
   BOOST_REQUIRE_EQUAL( APPROVED, disp["status"].as<uint8_t>() );
   BOOST_REQUIRE_EQUAL( 4u, disp["yes_votes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 3u, disp["no_votes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 7u, disp["total_votes"].as_uint64() );
   BOOST_REQUIRE( disp["resolution_round"].as_uint64() > 0 );

   //jurors on the winning side gain reputation
   for (uint32_t i = 0; i < voters.size(); ++i) {
      auto jur = get_juror(voters[i]);
      if (i < 4) {
         BOOST_REQUIRE_EQUAL( 101u, jur["reputation"].as_uint64() );
         BOOST_REQUIRE_EQUAL( 1u, jur["correct_votes"].as_uint64() );
      } else {
         BOOST_REQUIRE_EQUAL( 99u, jur["reputation"].as_uint64() );
         BOOST_REQUIRE_EQUAL( 0u, jur["correct_votes"].as_uint64() );
      }
   }

   //one bridge call for the dispute
   auto stl = get_settlement(did);
   BOOST_REQUIRE( !stl.is_null() );
   BOOST_REQUIRE_EQUAL( true, stl["approved"].as_bool() );
   BOOST_REQUIRE_EQUAL( 1u, stl["attempts"].as_uint64() );

   //later votes never alter a resolved dispute
   auto assigned = assigned_jurors(did);
   name late_juror;
   for (auto juror : assigned) {
      if (!contains(voters, juror)) {
         late_juror = juror;
         break;
      }
   }
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: dispute already resolved"), vote(late_juror, did, false) );
   BOOST_REQUIRE_EQUAL( APPROVED, get_dispute(did)["status"].as<uint8_t>() );

   auto st = get_dispute_stats();
   BOOST_REQUIRE_EQUAL( 1u, st["resolved_disputes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 0u, st["rejected_disputes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 7u, st["total_votes_cast"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( quorum_with_three_yes_rejects, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   register_jurors();
   uint64_t did = open_dispute(pid);

   auto voters = cast_votes(did, 3, 4);

   auto disp = get_dispute(did);
   BOOST_REQUIRE_EQUAL( REJECTED, disp["status"].as<uint8_t>() );
   BOOST_REQUIRE_EQUAL( 3u, disp["yes_votes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 4u, disp["no_votes"].as_uint64() );

   //no bridge call
   BOOST_REQUIRE( get_settlement(did).is_null() );
   BOOST_REQUIRE( get_receipt(did).is_null() );
   BOOST_REQUIRE_EQUAL( 0, get_policy(pid)["settled"].as<uint8_t>() );

   BOOST_REQUIRE_EQUAL( 99u, get_juror(voters[0])["reputation"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 101u, get_juror(voters[6])["reputation"].as_uint64() );

   auto st = get_dispute_stats();
   BOOST_REQUIRE_EQUAL( 0u, st["resolved_disputes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, st["rejected_disputes"].as_uint64() );

   //the resolution is the latest event
   auto window = query<std::pair<uint64_t, uint64_t>>(DISPUTE, "recentevents"_n, mvo()("limit", 1));
   BOOST_REQUIRE_EQUAL( "rejected"_n, get_dispute_event(window.second)["kind"].as<name>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( vote_cooldown, agriguard_tester ) try {
   uint64_t first_pid = open_policy(ALICE);
   uint64_t second_pid = open_policy(ALICE);
   register_jurors();

   uint64_t first = open_dispute(first_pid, "jurora"_n);
   uint64_t second = open_dispute(second_pid, "jurorb"_n);

   //a juror drawn for both disputes
   auto first_assigned = assigned_jurors(first);
   auto second_assigned = assigned_jurors(second);
   name juror;
   for (auto candidate : first_assigned) {
      if (contains(second_assigned, candidate)) {
         juror = candidate;
         break;
      }
   }
   BOOST_REQUIRE( juror != name() );

   BOOST_REQUIRE_EQUAL( success(), vote(juror, first, true) );

   skip_seconds(4);
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: juror must wait before voting again"), vote(juror, second, true) );
   BOOST_REQUIRE( get_vote(second, juror).is_null() );

   skip_seconds(6);
   BOOST_REQUIRE_EQUAL( success(), vote(juror, second, true) );
   BOOST_REQUIRE_EQUAL( 2u, get_juror(juror)["total_votes"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( deadline_expires_dispute, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   register_jurors();
   uint64_t did = open_dispute(pid);

   auto voters = cast_votes(did, 2, 1);
   BOOST_REQUIRE_EQUAL( ACTIVE, disputestat(did) );

   skip_seconds(1001);

   BOOST_REQUIRE_EQUAL( EXPIRED, disputestat(did) );
   BOOST_REQUIRE_EQUAL( EXPIRED, get_dispute(did)["status"].as<uint8_t>() );

   name late_juror;
   for (auto juror : assigned_jurors(did)) {
      if (!contains(voters, juror)) {
         late_juror = juror;
         break;
      }
   }
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: voting period has expired"), vote(late_juror, did, true) );

   //expiring is counted once
   BOOST_REQUIRE_EQUAL( EXPIRED, disputestat(did) );
   BOOST_REQUIRE_EQUAL( 1u, get_dispute_stats()["expired_disputes"].as_uint64() );

   BOOST_REQUIRE_EXCEPTION( disputestat(99), eosio_assert_message_exception,
      eosio_assert_message_is("StateError: dispute not found") );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( archive_resolved_disputes, agriguard_tester ) try {
   uint64_t first_pid = open_policy(ALICE);
   uint64_t second_pid = open_policy(ALICE);
   register_jurors();
   uint64_t approved = open_dispute(first_pid);
   uint64_t active = open_dispute(second_pid);

   cast_votes(approved, 4, 3);

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("AuthorizationError: caller is not the admin"), push(DISPUTE, ALICE, "archive"_n, mvo()("dispute_id", approved)) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: dispute not found"), push(DISPUTE, ADMIN, "archive"_n, mvo()("dispute_id", 99)) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: only approved or rejected disputes can be archived"),
      push(DISPUTE, ADMIN, "archive"_n, mvo()("dispute_id", active)) );

   BOOST_REQUIRE_EQUAL( success(), push(DISPUTE, ADMIN, "archive"_n, mvo()("dispute_id", approved)) );
   BOOST_REQUIRE_EQUAL( PROCESSED, get_dispute(approved)["status"].as<uint8_t>() );

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("StateError: only approved or rejected disputes can be archived"),
      push(DISPUTE, ADMIN, "archive"_n, mvo()("dispute_id", approved)) );

   auto window = query<std::pair<uint64_t, uint64_t>>(DISPUTE, "recentevents"_n, mvo()("limit", 1));
   BOOST_REQUIRE_EQUAL( "processed"_n, get_dispute_event(window.second)["kind"].as<name>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( juror_eligibility, agriguard_tester ) try {
   auto eligibility = [&](name juror) {
      return query<uint8_t>(DISPUTE, "valjuror"_n, mvo()("juror", juror));
   };

   BOOST_REQUIRE_EQUAL( 0, eligibility(ALICE) );

   //reputation below 100 makes a juror ineligible
   BOOST_REQUIRE_EQUAL( success(), push(DISPUTE, ADMIN, "setconfig"_n, mvo()
      ("voting_duration", 1000)("vote_cooldown", 10)("registration_warmup", 10)("dispute_warmup", 50)
      ("eligibility_wait", 50)("jurors_per_dispute", 10)("quorum", 7)("majority", 4)
      ("initial_reputation", 100)("min_reputation", 100)("min_stake", "1.0000 TLOS")) );

   uint64_t pid = open_policy(ALICE);
   register_jurors();
   BOOST_REQUIRE_EQUAL( 1, eligibility("jurora"_n) );

   uint64_t did = open_dispute(pid);
   auto voters = cast_votes(did, 4, 3);

   skip_seconds(51);
   BOOST_REQUIRE_EQUAL( 3, eligibility(voters[0]) );
   BOOST_REQUIRE_EQUAL( 2, eligibility(voters[6]) );
   BOOST_REQUIRE_EQUAL( 3, eligibility("jurora"_n) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( setconfig_validation, agriguard_tester ) try {
   auto setconfig = [&](uint8_t jurors_per_dispute, uint8_t quorum, uint8_t majority) {
      return push(DISPUTE, ADMIN, "setconfig"_n, mvo()
         ("voting_duration", 1000)("vote_cooldown", 10)("registration_warmup", 10)("dispute_warmup", 50)
         ("eligibility_wait", 50)("jurors_per_dispute", jurors_per_dispute)("quorum", quorum)("majority", majority)
         ("initial_reputation", 100)("min_reputation", 10)("min_stake", "1.0000 TLOS"));
   };

   BOOST_REQUIRE_EQUAL( wasm_assert_msg("ValidationError: majority must be greater than 0"), setconfig(10, 7, 0) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("ValidationError: majority can't be greater than the quorum"), setconfig(10, 7, 8) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("ValidationError: quorum can't be greater than the jurors per dispute"), setconfig(10, 11, 6) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("AuthorizationError: caller is not the admin"),
      push(DISPUTE, BOB, "setinslink"_n, mvo()("insurance_contract", BOB)) );
   BOOST_REQUIRE_EQUAL( wasm_assert_msg("AuthorizationError: caller is not the admin"),
      push(DISPUTE, BOB, "setadmin"_n, mvo()("new_admin", BOB)) );

   //a smaller panel resolves with three votes
   BOOST_REQUIRE_EQUAL( success(), setconfig(5, 3, 2) );

   uint64_t pid = open_policy(ALICE);
   register_jurors();
   uint64_t did = open_dispute(pid);
   BOOST_REQUIRE_EQUAL( 5u, assigned_jurors(did).size() );

   cast_votes(did, 1, 2);
   BOOST_REQUIRE_EQUAL( REJECTED, get_dispute(did)["status"].as<uint8_t>() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( events_and_stats, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   register_jurors();
   uint64_t did = open_dispute(pid);

   //initialized, twelve registrations and the new dispute
   auto window = query<std::pair<uint64_t, uint64_t>>(DISPUTE, "recentevents"_n, mvo()("limit", 100));
   BOOST_REQUIRE_EQUAL( 14u, window.first );
   BOOST_REQUIRE_EQUAL( 0u, window.second );

   auto ev = get_dispute_event(13);
   BOOST_REQUIRE_EQUAL( "dispcreated"_n, ev["kind"].as<name>() );
   BOOST_REQUIRE_EQUAL( did, ev["dispute_id"].as_uint64() );
   BOOST_REQUIRE_EQUAL( "jurora"_n, ev["actor"].as<name>() );

   auto voters = cast_votes(did, 1, 0);
   ev = get_dispute_event(14);
   BOOST_REQUIRE_EQUAL( "votecast"_n, ev["kind"].as<name>() );
   BOOST_REQUIRE_EQUAL( voters[0], ev["actor"].as<name>() );
   BOOST_REQUIRE_EQUAL( 1u, ev["value"].as_uint64() );

   auto st = get_dispute_stats();
   BOOST_REQUIRE_EQUAL( 12u, st["active_jurors"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, st["total_disputes"].as_uint64() );
   BOOST_REQUIRE_EQUAL( 1u, st["total_votes_cast"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( juror_draw_ranks_whole_registry, agriguard_tester ) try {
   uint64_t pid = open_policy(ALICE);
   register_jurors();
   BOOST_REQUIRE_EQUAL( 12u, get_dispute_stats()["active_jurors"].as_uint64() );

   const name claimant = "jurora"_n;
   uint64_t round = now();
   uint64_t did = open_dispute(pid, claimant);

   //every registered juror but the claimant is ranked, the ten lowest ranks are drawn
   vector<std::pair<uint64_t, name>> ranked;
   for (auto juror : jurors) {
      if (juror != claimant) {
         ranked.emplace_back(draw_rank(did, round, juror), juror);
      }
   }
   std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
      return a.first != b.first ? a.first < b.first : a.second.to_uint64_t() < b.second.to_uint64_t();
   });
   ranked.resize(10);

   vector<name> expected;
   for (const auto& r : ranked) {
      expected.push_back(r.second);
   }

   auto assigned = assigned_jurors(did);
   BOOST_REQUIRE_EQUAL( expected.size(), assigned.size() );
   for (const auto& r : ranked) {
      BOOST_REQUIRE( contains(assigned, r.second) );

      auto row = get_row(DISPUTE, name(did), "assignments"_n, r.second.to_uint64_t(), "assignment");
      BOOST_REQUIRE_EQUAL( r.first, row["rank"].as_uint64() );
   }

   //eleven candidates for ten seats, so one of the last two registrations is always drawn
   BOOST_REQUIRE( contains(assigned, "jurork"_n) || contains(assigned, "jurorl"_n) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( active_dispute_count, agriguard_tester ) try {
   auto tally = [&]() {
      return query<std::pair<uint64_t, uint64_t>>(DISPUTE, "activedisp"_n, mvo());
   };

   BOOST_REQUIRE_EQUAL( 0u, tally().first );
   BOOST_REQUIRE_EQUAL( 0u, tally().second );

   uint64_t first_pid = open_policy(ALICE);
   uint64_t second_pid = open_policy(ALICE);
   register_jurors();
   uint64_t resolved = open_dispute(first_pid);
   uint64_t stale = open_dispute(second_pid);

   auto counts = tally();
   BOOST_REQUIRE_EQUAL( 2u, counts.first );
   BOOST_REQUIRE_EQUAL( 2u, counts.second );

   cast_votes(resolved, 3, 4);
   BOOST_REQUIRE_EQUAL( REJECTED, get_dispute(resolved)["status"].as<uint8_t>() );

   counts = tally();
   BOOST_REQUIRE_EQUAL( 1u, counts.first );
   BOOST_REQUIRE_EQUAL( 2u, counts.second );

   //expiry closes the other one
   skip_seconds(1001);
   BOOST_REQUIRE_EQUAL( EXPIRED, disputestat(stale) );

   counts = tally();
   BOOST_REQUIRE_EQUAL( 0u, counts.first );
   BOOST_REQUIRE_EQUAL( 2u, counts.second );
   BOOST_REQUIRE_EQUAL( 0u, get_dispute_stats()["active_disputes"].as_uint64() );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
