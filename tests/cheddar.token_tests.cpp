#include <boost/test/unit_test.hpp>
#include <fc/log/logger.hpp>

#include "cheddar.farm_tester.hpp"

struct token_tester : farm_tester {
   action_result mintvested(name to, const asset& quantity, time_point_sec cliff, time_point_sec end,
                            name authorizer = tokens) {
      return push_action(tokens, authorizer, "mintvested"_n,
                         mvo()("to", to)("quantity", quantity)("cliff", cliff)("end", end)("memo", "vesting"));
   }

   action_result cancelvest(name owner, const char* sym, name authorizer = tokens) {
      return push_action(tokens, authorizer, "cancelvest"_n, mvo()("owner", owner)("sym", symbol::from_string(sym)));
   }

   asset getlocked(name owner, const char* sym) {
      return push_for_result(owner, "getlocked"_n, mvo()("owner", owner)("sym", symbol::from_string(sym)), tokens)
            .as<asset>();
   }

   asset get_supply(const char* sym_str) {
      auto         sym  = symbol::from_string(sym_str);
      auto         code = name(sym.to_symbol_code().value);
      vector<char> data = get_row_by_account(tokens, code, "stat"_n, code);
      return token_abi_ser
            .binary_to_variant("currency_stats", data, abi_serializer::create_yield_function(abi_serializer_max_time))
                  ["supply"]
            .as<asset>();
   }

   fc::variant get_vesting(name owner, const char* sym_str) {
      auto         sym  = symbol::from_string(sym_str);
      vector<char> data = get_row_by_account(tokens, name(sym.to_symbol_code().value), "vestings"_n, owner);
      return data.empty() ? fc::variant()
                          : token_abi_ser.binary_to_variant("vesting_record", data, abi_serializer::create_yield_function(
                                                                                          abi_serializer_max_time));
   }
};

BOOST_AUTO_TEST_SUITE(cheddar_token_tests)

BOOST_AUTO_TEST_CASE(transfer) try {
   token_tester t;
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, tokens, alice, a("10.0000 CHDR")));
   BOOST_TEST(t.get_balance(alice, "4,CHDR") == a("10.0000 CHDR"));

   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("overdrawn balance"), t.transfer(tokens, alice, bob, a("10.0001 CHDR")));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("cannot transfer to self"), t.transfer(tokens, alice, alice, a("1.0000 CHDR")));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("symbol precision mismatch"),
                       t.transfer(tokens, alice, bob, a("1.00 CHDR")));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("must transfer positive quantity"),
                       t.transfer(tokens, alice, bob, a("0.0000 CHDR")));
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, alice, bob, a("4.0000 CHDR")));
   BOOST_TEST(t.get_balance(bob, "4,CHDR") == a("4.0000 CHDR"));

   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("Cannot close because the balance is not zero."),
                       t.push_action(tokens, bob, "close"_n, mvo()("owner", bob)("symbol", symbol::from_string("4,CHDR"))));
   BOOST_REQUIRE_EQUAL(t.success(), t.push_action(tokens, tokens, "retire"_n,
                                                  mvo()("quantity", a("1000.0000 CHDR"))("memo", "")));
   BOOST_TEST(t.get_supply("4,CHDR") == a("99999000.0000 CHDR"));
} // transfer
FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(mintvested) try {
   token_tester t;
   auto         now = t.now();

   BOOST_REQUIRE_EQUAL("missing authority of cheddar.tkn",
                       t.mintvested(alice, a("1000.0000 CHDR"), now + 100, now + 200, alice));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("vesting amount must be positive"),
                       t.mintvested(alice, a("0.0000 CHDR"), now + 100, now + 200));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("cliff can't be later than the vesting end"),
                       t.mintvested(alice, a("1000.0000 CHDR"), now + 201, now + 200));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("token with symbol does not exist"),
                       t.mintvested(alice, a("1000.0000 XYZ"), now + 100, now + 200));

   auto supply = t.get_supply("4,CHDR");
   BOOST_REQUIRE_EQUAL(t.success(), t.mintvested(alice, a("1000.0000 CHDR"), now + 100, now + 200));
   BOOST_TEST(t.get_balance(alice, "4,CHDR") == a("1000.0000 CHDR"));
   BOOST_TEST(t.get_supply("4,CHDR") == supply + a("1000.0000 CHDR"));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("account already has a vesting schedule"),
                       t.mintvested(alice, a("1.0000 CHDR"), now + 100, now + 200));

   // a schedule on another token is independent
   BOOST_REQUIRE_EQUAL(t.success(), t.mintvested(alice, a("1.0000 WRD"), now + 100, now + 200));

   auto v = t.get_vesting(alice, "4,CHDR");
   BOOST_TEST(v["amount"].as<asset>() == a("1000.0000 CHDR"));
   BOOST_TEST(v["cliff"].as<time_point_sec>() == now + 100);
   BOOST_TEST(v["end"].as<time_point_sec>() == now + 200);
} // mintvested
FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(locked_amount) try {
   token_tester t;
   auto         now = t.now();
   BOOST_REQUIRE_EQUAL(t.success(), t.mintvested(alice, a("1000.0000 CHDR"), now + 100, now + 200));
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, tokens, alice, a("100.0000 CHDR")));

   // before the cliff only the unvested tokens can move
   BOOST_TEST(t.getlocked(alice, "4,CHDR") == a("1000.0000 CHDR"));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("vesting violation: 1000.0000 CHDR is still locked"),
                       t.transfer(tokens, alice, bob, a("100.0001 CHDR")));
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, alice, bob, a("100.0000 CHDR")));

   t.skip_to(time_point(now + 150));
   BOOST_TEST(t.getlocked(alice, "4,CHDR") == a("500.0000 CHDR"));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("vesting violation: 500.0000 CHDR is still locked"),
                       t.transfer(tokens, alice, bob, a("500.0001 CHDR")));
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, alice, bob, a("500.0000 CHDR")));
   BOOST_TEST(!t.get_vesting(alice, "4,CHDR").is_null());

   t.skip_to(time_point(now + 200));
   BOOST_TEST(t.getlocked(alice, "4,CHDR") == a("0.0000 CHDR"));
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, alice, bob, a("500.0000 CHDR")));
   // the schedule is removed once nothing is locked
   BOOST_TEST(t.get_vesting(alice, "4,CHDR").is_null());
   BOOST_TEST(t.getlocked(bob, "4,CHDR") == a("0.0000 CHDR"));
} // locked_amount
FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(cancelvest) try {
   token_tester t;
   auto         now = t.now();
   BOOST_REQUIRE_EQUAL(t.success(), t.mintvested(alice, a("1000.0000 CHDR"), now + 100, now + 200));
   BOOST_REQUIRE_EQUAL(t.success(), t.mintvested(bob, a("10.0000 CHDR"), now + 10, now + 20));
   auto supply = t.get_supply("4,CHDR");

   t.skip_to(time_point(now + 150));
   BOOST_REQUIRE_EQUAL("missing authority of cheddar.tkn", t.cancelvest(alice, "4,CHDR", alice));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("account has no vesting schedule"), t.cancelvest(carol, "4,CHDR"));
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("nothing left locked"), t.cancelvest(bob, "4,CHDR"));

   BOOST_REQUIRE_EQUAL(t.success(), t.cancelvest(alice, "4,CHDR"));
   BOOST_TEST(t.get_balance(alice, "4,CHDR") == a("500.0000 CHDR"));
   BOOST_TEST(t.get_supply("4,CHDR") == supply - a("500.0000 CHDR"));
   BOOST_TEST(t.get_vesting(alice, "4,CHDR").is_null());

   // the vested half is free
   BOOST_REQUIRE_EQUAL(t.success(), t.transfer(tokens, alice, carol, a("500.0000 CHDR")));
} // cancelvest
FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE(vested_tokens_stake) try {
   token_tester t;
   t.setup_farm();
   t.fund_and_open(alice, {});
   auto now = t.now();
   BOOST_REQUIRE_EQUAL(t.success(), t.mintvested(alice, a("10.0000 STK"), now + 3600, now + 7200));

   // locked tokens can't leave the account, not even to the farm
   BOOST_REQUIRE_EQUAL(t.wasm_assert_msg("vesting violation: 10.0000 STK is still locked"),
                       t.stake(alice, a("1.0000 STK")));
} // vested_tokens_stake
FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
