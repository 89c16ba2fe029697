/**
 * Definitions shared by the AgriGuard insurance and dispute contracts.
 */

#pragma once
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/system.hpp>

#include <string>

namespace agriguard {

    static constexpr eosio::symbol CORE_SYM = eosio::symbol("TLOS", 4);

    //error taxonomy, carried as the prefix of the check() message
    enum class error_kind : uint8_t
    {
        VALIDATION = 1,
        AUTHORIZATION = 2,
        STATE = 3,
        RESOURCE = 4,
    };

    inline const char* error_prefix(error_kind kind)
    {
        switch (kind) {
            case error_kind::VALIDATION:    return "ValidationError: ";
            case error_kind::AUTHORIZATION: return "AuthorizationError: ";
            case error_kind::STATE:         return "StateError: ";
            case error_kind::RESOURCE:      return "ResourceError: ";
        }
        return "Error: ";
    }

    inline std::string format_error(error_kind kind, const char* msg)
    {
        return std::string(error_prefix(kind)) + msg;
    }

    //aborts the action (and every write it made) with a prefixed message
    inline void fail_unless(bool pred, error_kind kind, const char* msg)
    {
        if (!pred) {
            eosio::check(false, format_error(kind, msg));
        }
    }

    inline void check_valid(bool pred, const char* msg) { fail_unless(pred, error_kind::VALIDATION, msg); }
    inline void check_authorized(bool pred, const char* msg) { fail_unless(pred, error_kind::AUTHORIZATION, msg); }
    inline void check_state(bool pred, const char* msg) { fail_unless(pred, error_kind::STATE, msg); }
    inline void check_funds(bool pred, const char* msg) { fail_unless(pred, error_kind::RESOURCE, msg); }

    //logical clock: the only notion of time read by the contracts
    inline uint64_t current_round()
    {
        return eosio::current_time_point().sec_since_epoch();
    }

    //reply of the recentevents query
    struct event_window
    {
        uint64_t total;
        uint64_t first_id;

        EOSLIB_SERIALIZE(event_window, (total)(first_id))
    };

    template <typename Table>
    event_window recent_window(Table& events, uint32_t limit)
    {
        event_window window{0, 0};

        if (events.begin() == events.end()) {
            return window;
        }

        //ids are handed out by available_primary_key, so the newest row is the last one
        uint64_t next_id = events.available_primary_key();
        uint64_t first_id = events.begin()->event_id;

        window.total = next_id - first_id;
        window.first_id = limit >= window.total ? first_id : next_id - limit;
        return window;
    }

} // namespace agriguard
