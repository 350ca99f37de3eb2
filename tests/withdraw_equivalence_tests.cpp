#include "fundme_tester.hpp"

#include <random>

using namespace crowdfund::test;

namespace {

// amounts a random funder picks from, the first one is below the 5 USD floor
const vector<asset> fund_amounts = {
   flon("0.00100000"),
   flon("0.00250000"),
   flon("0.10000000"),
   flon("0.25000000"),
   flon("1.00000000")
};

struct fund_call {
   size_t   funder;
   asset    quantity;
};

vector<fund_call> make_fund_sequence( uint32_t seed, size_t count, size_t funder_count ) {
   std::mt19937 gen( seed );
   std::uniform_int_distribution<size_t> pick_funder( 0, funder_count - 1 );
   std::uniform_int_distribution<size_t> pick_amount( 0, fund_amounts.size() - 1 );

   vector<fund_call> calls;
   for (size_t i = 0; i < count; i++) {
      calls.push_back( { pick_funder(gen), fund_amounts[pick_amount(gen)] } );
   }
   return calls;
}

void replay( fundme_tester& t, const vector<fund_call>& calls ) {
   for (const auto& call : calls) {
      auto result = t.fund( t.funders[call.funder], call.quantity );
      if (call.quantity < flon("0.00250000")) {
         BOOST_REQUIRE_EQUAL( t.wasm_assert_msg( "[[40]] You need to spend more FLON!" ), result );
      } else {
         BOOST_REQUIRE_EQUAL( t.success(), result );
      }
   }
}

void prepare( fundme_tester& t ) {
   t.deploy();
   for (const auto& funder : t.funders) {
      t.hoax( funder );
   }
}

// funders rows 0..count-1 hold the same entries on both ledgers, nothing is stored past them
void require_same_funder_rows( fundme_tester& a, fundme_tester& b, uint64_t count ) {
   for (uint64_t id = 0; id < count; id++) {
      auto row_a = a.get_funder_row( id );
      auto row_b = b.get_funder_row( id );
      BOOST_REQUIRE( !row_a.is_null() );
      BOOST_REQUIRE( !row_b.is_null() );
      BOOST_REQUIRE_EQUAL( row_a["funder"].as<name>(), row_b["funder"].as<name>() );
      BOOST_REQUIRE_EQUAL( row_a["quantity"].as<asset>(), row_b["quantity"].as<asset>() );
   }
   BOOST_REQUIRE( a.get_funder_row( count ).is_null() );
   BOOST_REQUIRE( b.get_funder_row( count ).is_null() );
}

// no funders row below `count` and no funded row of any funder survives a withdrawal
void require_rows_cleared( fundme_tester& t, uint64_t count ) {
   for (uint64_t id = 0; id < count; id++) {
      BOOST_REQUIRE( t.get_funder_row( id ).is_null() );
   }
   for (const auto& funder : t.funders) {
      BOOST_REQUIRE( t.get_funded_row( funder ).is_null() );
   }
}

} // namespace

BOOST_AUTO_TEST_SUITE(withdraw_equivalence_tests)

BOOST_AUTO_TEST_CASE( withdraw_variants_leave_identical_state ) try {
   for (uint32_t seed : { 7u, 42u, 2024u }) {
      fundme_tester standard;
      fundme_tester cheaper;
      prepare( standard );
      prepare( cheaper );

      const auto calls = make_fund_sequence( seed, 20, standard.funders.size() );
      replay( standard, calls );
      replay( cheaper, calls );

      const auto funded_state = standard.get_ledger_state();
      BOOST_REQUIRE_EQUAL( funded_state, cheaper.get_ledger_state() );
      require_same_funder_rows( standard, cheaper, funded_state.funder_count );

      BOOST_REQUIRE_EQUAL( standard.success(), standard.withdraw( OWNER ) );
      BOOST_REQUIRE_EQUAL( cheaper.success(), cheaper.cheap_withdraw( OWNER ) );

      const auto standard_state = standard.get_ledger_state();
      BOOST_REQUIRE_EQUAL( standard_state, cheaper.get_ledger_state() );
      require_rows_cleared( standard, funded_state.funder_count );
      require_rows_cleared( cheaper, funded_state.funder_count );

      BOOST_REQUIRE_EQUAL( 0u, standard_state.funder_count );
      BOOST_REQUIRE_EQUAL( ZERO, standard_state.total_funded );
      BOOST_REQUIRE_EQUAL( ZERO, standard_state.fundme_balance );
      BOOST_REQUIRE_EQUAL( funded_state.owner_balance + funded_state.fundme_balance, standard_state.owner_balance );
      for (const auto& item : standard_state.funded) {
         BOOST_REQUIRE_EQUAL( ZERO, item.second );
      }
   }
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE( nine_funders_same_amount ) try {
   fundme_tester standard;
   fundme_tester cheaper;
   prepare( standard );
   prepare( cheaper );

   for (size_t i = 0; i < standard.funders.size(); i++) {
      standard.fund_fundme( standard.funders[i] );
      cheaper.fund_fundme( cheaper.funders[i] );
   }

   const uint64_t count = standard.funders.size();
   require_same_funder_rows( standard, cheaper, count );

   standard.withdraw_fundme();
   BOOST_REQUIRE_EQUAL( cheaper.success(), cheaper.cheap_withdraw( OWNER ) );

   const auto state = standard.get_ledger_state();
   BOOST_REQUIRE_EQUAL( state, cheaper.get_ledger_state() );
   require_rows_cleared( standard, count );
   require_rows_cleared( cheaper, count );
   BOOST_REQUIRE_EQUAL( flon("0.90000000"), state.owner_balance );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
