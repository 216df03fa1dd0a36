#include "test_utils.hpp"

extern void log_test_main();
extern void term_test_main();
extern void substitute_test_main();
extern void lexer_test_main();
extern void parser_test_main();
extern void analysis_test_main();
extern void classifier_test_main();
extern void reducer_test_main();
extern void engine_test_main();

void unit_test_main() {
  constexpr bool ENABLE_DEBUG_LOGS = true;

  TEST(log_test_main);
  TEST(term_test_main);
  TEST(substitute_test_main);
  TEST(lexer_test_main);
  TEST(parser_test_main);
  TEST(analysis_test_main);
  TEST(classifier_test_main);
  TEST(reducer_test_main);
  TEST(engine_test_main);
}

int main() {
  unit_test_main();

  return 0;
}
