// tests/proof/test_verification_builder.cpp
#define BOOST_TEST_MODULE Verification_Builder_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmpxx.h>
#include <verity/proof/error.hpp>
#include <verity/proof/verification_builder.hpp>
#include <verity/util/word.hpp>
#include <initializer_list>
#include <string>
#include <vector>

using namespace verity;

namespace {
std::vector<word_t> make_words(std::initializer_list<u64> values) {
    std::vector<word_t> out;
    for (u64 v : values) {
        out.push_back(make_word(v));
    }
    return out;
}

// Expect consume(kind) to fail with the given code
void check_exhausted(verification_builder& builder, queue_kind kind, error_code expected) {
    try {
        builder.consume(kind);
        BOOST_ERROR("consume did not throw for " << to_string(kind));
    }
    catch (const queue_exhausted& e) {
        BOOST_CHECK(e.code() == expected);
        BOOST_CHECK(e.kind() == kind);
    }
}

struct builder_fixture {
    verification_builder builder;
};
}

// ============================================================================
// Test Suite: Scenarios
// ============================================================================

BOOST_AUTO_TEST_SUITE(Scenario_Tests)

BOOST_FIXTURE_TEST_CASE(empty_challenge_queue_fails_first_consume, builder_fixture) {
    std::vector<word_t> none;
    builder.set_challenges(none);

    check_exhausted(builder, queue_kind::challenge, error_code::too_few_challenges);
}

BOOST_FIXTURE_TEST_CASE(single_challenge, builder_fixture) {
    auto words = make_words({ 0x12345678 });
    builder.set_challenges(words);

    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_challenge()), mpz_class(0x12345678));
    check_exhausted(builder, queue_kind::challenge, error_code::too_few_challenges);
}

BOOST_FIXTURE_TEST_CASE(three_final_round_evaluations, builder_fixture) {
    std::vector<word_t> words = {
        word_from_hex("0xaaaa"),
        word_from_hex("0xbbbb"),
        word_from_hex("0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000000"),
    };
    builder.set_final_round_evaluations(words);

    BOOST_CHECK(builder.consume_final_round_evaluation() == words[0]);
    BOOST_CHECK(builder.consume_final_round_evaluation() == words[1]);
    BOOST_CHECK(builder.consume_final_round_evaluation() == words[2]);
    check_exhausted(builder, queue_kind::final_round_evaluation,
                    error_code::too_few_final_round_mles);
}

BOOST_FIXTURE_TEST_CASE(unset_queue_is_exhausted, builder_fixture) {
    BOOST_CHECK_EQUAL(builder.head_offset(queue_kind::rho_evaluation), 0u);
    BOOST_CHECK_EQUAL(builder.tail_offset(queue_kind::rho_evaluation), 0u);
    check_exhausted(builder, queue_kind::rho_evaluation, error_code::too_few_rho_evaluations);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: FIFO and exhaustion for every queue kind
// ============================================================================

BOOST_AUTO_TEST_SUITE(Queue_Kind_Tests)

BOOST_AUTO_TEST_CASE(every_kind_drains_in_order_then_fails) {
    for (queue_kind kind : all_queue_kinds) {
        for (u64 n = 0; n < 6; ++n) {
            verification_builder builder;
            std::vector<word_t> words;
            for (u64 i = 0; i < n; ++i) {
                words.push_back(make_word(0x1000 * (index_of(kind) + 1) + i));
            }
            builder.set(kind, words);

            for (u64 i = 0; i < n; ++i) {
                BOOST_CHECK(builder.consume(kind) == words[i]);
            }
            check_exhausted(builder, kind, exhaustion_code(kind));
        }
    }
}

BOOST_AUTO_TEST_CASE(each_kind_has_its_own_code) {
    BOOST_CHECK(exhaustion_code(queue_kind::challenge) == error_code::too_few_challenges);
    BOOST_CHECK(exhaustion_code(queue_kind::first_round_evaluation) == error_code::too_few_first_round_mles);
    BOOST_CHECK(exhaustion_code(queue_kind::final_round_evaluation) == error_code::too_few_final_round_mles);
    BOOST_CHECK(exhaustion_code(queue_kind::chi_evaluation) == error_code::too_few_chi_evaluations);
    BOOST_CHECK(exhaustion_code(queue_kind::rho_evaluation) == error_code::too_few_rho_evaluations);

    BOOST_CHECK_EQUAL(std::string(to_string(error_code::too_few_first_round_mles)), "TooFewFirstRoundMLEs");
    BOOST_CHECK_EQUAL(static_cast<u32>(error_code::too_few_rho_evaluations), 5u);
}

BOOST_FIXTURE_TEST_CASE(named_accessors_map_to_their_queue, builder_fixture) {
    auto c = make_words({ 1 });
    auto f = make_words({ 2 });
    auto l = make_words({ 3 });
    auto x = make_words({ 4 });
    auto r = make_words({ 5 });

    builder.set_challenges(c);
    builder.set_first_round_evaluations(f);
    builder.set_final_round_evaluations(l);
    builder.set_chi_evaluations(x);
    builder.set_rho_evaluations(r);

    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_rho_evaluation()), 5);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_chi_evaluation()), 4);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_final_round_evaluation()), 3);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_first_round_evaluation()), 2);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_challenge()), 1);
    BOOST_CHECK(builder.drained());
}

BOOST_FIXTURE_TEST_CASE(queues_are_independent, builder_fixture) {
    auto challenges = make_words({ 10, 11 });
    auto chis       = make_words({ 20 });
    builder.set_challenges(challenges);
    builder.set_chi_evaluations(chis);

    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_chi_evaluation()), 20);
    check_exhausted(builder, queue_kind::chi_evaluation, error_code::too_few_chi_evaluations);

    BOOST_CHECK_EQUAL(builder.remaining(queue_kind::challenge), 2u);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_challenge()), 10);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_challenge()), 11);
    check_exhausted(builder, queue_kind::challenge, error_code::too_few_challenges);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: Cursor state
// ============================================================================

BOOST_AUTO_TEST_SUITE(Cursor_Tests)

BOOST_FIXTURE_TEST_CASE(offsets_advance_by_word_size, builder_fixture) {
    auto words = make_words({ 1, 2, 3 });
    builder.set_first_round_evaluations(words);

    const auto kind = queue_kind::first_round_evaluation;
    BOOST_CHECK_EQUAL(builder.head_offset(kind), 0u);
    BOOST_CHECK_EQUAL(builder.tail_offset(kind), 3 * word_size);

    builder.consume(kind);
    BOOST_CHECK_EQUAL(builder.head_offset(kind), word_size);
    BOOST_CHECK_EQUAL(builder.remaining(kind), 2u);
    BOOST_CHECK_EQUAL((builder.tail_offset(kind) - builder.head_offset(kind)) % word_size, 0u);
}

BOOST_FIXTURE_TEST_CASE(failed_consume_leaves_state_untouched, builder_fixture) {
    auto words = make_words({ 9 });
    builder.set_chi_evaluations(words);
    builder.consume_chi_evaluation();

    const auto kind = queue_kind::chi_evaluation;
    const size_t head = builder.head_offset(kind);
    const size_t tail = builder.tail_offset(kind);

    for (int attempt = 0; attempt < 3; ++attempt) {
        check_exhausted(builder, kind, error_code::too_few_chi_evaluations);
        BOOST_CHECK_EQUAL(builder.head_offset(kind), head);
        BOOST_CHECK_EQUAL(builder.tail_offset(kind), tail);
    }
}

BOOST_FIXTURE_TEST_CASE(builder_borrows_instead_of_copying, builder_fixture) {
    auto words = make_words({ 1, 2 });
    builder.set_challenges(words);

    BOOST_CHECK_EQUAL(&builder.consume_challenge(), &words[0]);
    BOOST_CHECK_EQUAL(&builder.consume_challenge(), &words[1]);
}

BOOST_FIXTURE_TEST_CASE(re_set_discards_previous_cursor, builder_fixture) {
    auto first  = make_words({ 1, 2, 3 });
    auto second = make_words({ 7 });

    builder.set_challenges(first);
    builder.consume_challenge();
    builder.set_challenges(second);

    BOOST_CHECK_EQUAL(builder.head_offset(queue_kind::challenge), 0u);
    BOOST_CHECK_EQUAL(builder.remaining(queue_kind::challenge), 1u);
    BOOST_CHECK_EQUAL(word_to_mpz(builder.consume_challenge()), 7);
    check_exhausted(builder, queue_kind::challenge, error_code::too_few_challenges);
}

BOOST_AUTO_TEST_CASE(slot_layout) {
    BOOST_CHECK_EQUAL(params::head_slot(queue_kind::challenge), params::slot::challenge_head);
    BOOST_CHECK_EQUAL(params::tail_slot(queue_kind::challenge), params::slot::challenge_tail);
    BOOST_CHECK_EQUAL(params::head_slot(queue_kind::first_round_evaluation), params::slot::first_round_eval_head);
    BOOST_CHECK_EQUAL(params::tail_slot(queue_kind::final_round_evaluation), params::slot::final_round_eval_tail);
    BOOST_CHECK_EQUAL(params::head_slot(queue_kind::chi_evaluation), params::slot::chi_eval_head);
    BOOST_CHECK_EQUAL(params::tail_slot(queue_kind::rho_evaluation), params::slot::rho_eval_tail);
    BOOST_CHECK_EQUAL(params::builder_size, 320u);
}

BOOST_AUTO_TEST_SUITE_END()
