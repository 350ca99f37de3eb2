#include <iostream>
#include <boost/test/included/unit_test.hpp>
#include <fc/log/logger.hpp>
#include <eosio/chain/exceptions.hpp>

void translate_fc_exception(const fc::exception &e) {
   std::cerr << "\033[33m" <<  e.to_detail_string() << "\033[0m" << std::endl;
   BOOST_TEST_FAIL("Caught Unexpected Exception");
}

boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
   // chain logging stays off unless "--verbose" is passed after "--"
   bool is_verbose = false;
   std::string verbose_arg = "--verbose";
   for (int i = 0; i < argc; i++) {
      if (verbose_arg == argv[i]) {
         is_verbose = true;
         break;
      }
   }
   fc::logger::get(DEFAULT_LOGGER).set_log_level(is_verbose ? fc::log_level::debug : fc::log_level::off);

   boost::unit_test::unit_test_monitor.register_exception_translator<fc::exception>(&translate_fc_exception);
   return nullptr;
}
