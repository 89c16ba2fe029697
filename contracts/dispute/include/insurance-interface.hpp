#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>

using namespace eosio;
using namespace std;

namespace insurance_iface {

    //the tables below belong to the insurance contract ABI, not this one

    //scope: insurance contract account
    //ram:
    struct [[eosio::table, eosio::contract("insurance")]] policy {
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
        uint8_t settled; //0 unsettled, 1 settled
        uint64_t settled_at;
        asset payout;

        uint64_t primary_key() const { return policy_id; }
        uint64_t by_owner() const { return owner.value; }

        EOSLIB_SERIALIZE(policy, (policy_id)(owner)(zip_code)(t0)(t1)(cap)(direction)(threshold)(slope)
            (fee_paid)(settled)(settled_at)(payout))
    };
    typedef multi_index<name("policies"), policy,
        indexed_by<name("byowner"), const_mem_fun<policy, uint64_t, &policy::by_owner>>> policies_table;

    //scope: insurance contract account
    struct [[eosio::table("config"), eosio::contract("insurance")]] config {
        name admin;
        string contract_version;
        name oracle;
        name dispute_contract;
        uint64_t next_policy_id;
        uint64_t creation_round;
        uint32_t min_lead_time;
        uint32_t min_duration;
        uint32_t dispute_window;
        asset available_funds;

        EOSLIB_SERIALIZE(config, (admin)(contract_version)(oracle)(dispute_contract)(next_policy_id)
            (creation_round)(min_lead_time)(min_duration)(dispute_window)(available_funds))
    };
    typedef singleton<name("config"), config> config_singleton;

}
