/**
 * Deterministic juror selection.
 *
 * Every candidate is ranked by the first 8 bytes of sha256(dispute_id || round || juror)
 * and the lowest ranks win. Anyone holding the juror registry and the round of the
 * call can reproduce the draw.
 */

#pragma once
#include <eosio/crypto.hpp>
#include <eosio/name.hpp>

#include <algorithm>
#include <cstring>
#include <vector>

namespace agriguard {

    struct ranked_juror
    {
        eosio::name juror;
        uint64_t rank;
    };

    inline uint64_t juror_rank(uint64_t dispute_id, uint64_t round, eosio::name juror)
    {
        char buf[3 * sizeof(uint64_t)];
        uint64_t juror_value = juror.value;
        memcpy(buf, &dispute_id, sizeof(uint64_t));
        memcpy(buf + sizeof(uint64_t), &round, sizeof(uint64_t));
        memcpy(buf + 2 * sizeof(uint64_t), &juror_value, sizeof(uint64_t));

        auto digest = eosio::sha256(buf, sizeof(buf)).extract_as_byte_array();

        uint64_t rank = 0;
        for (int i = 0; i < 8; ++i) {
            rank = (rank << 8) | digest[i];
        }
        return rank;
    }

    //ranks every row of the juror registry except the excluded account, returns at most count jurors
    template <typename JurorTable>
    std::vector<ranked_juror> select_jurors(JurorTable &jurors, uint64_t dispute_id, uint64_t round,
        eosio::name excluded, uint32_t count)
    {
        std::vector<ranked_juror> ranked;
        for (auto itr = jurors.begin(); itr != jurors.end(); ++itr) {
            if (itr->juror == excluded) {
                continue;
            }
            ranked.push_back(ranked_juror{itr->juror, juror_rank(dispute_id, round, itr->juror)});
        }

        std::sort(ranked.begin(), ranked.end(), [](const ranked_juror &a, const ranked_juror &b) {
            return a.rank != b.rank ? a.rank < b.rank : a.juror.value < b.juror.value;
        });

        if (ranked.size() > count) {
            ranked.resize(count);
        }
        return ranked;
    }

} // namespace agriguard
