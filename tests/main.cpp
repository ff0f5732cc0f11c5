#include <iostream>

int test_hash();
int test_random();
int test_prompt();
int test_palette();
int test_canvas();
int test_atmosphere();
int test_scene_motif();
int test_accents();
int test_post_process();
int test_placeholder();
int test_scene_renderer();
int test_image_generator();
int test_generator_config();
int test_cvars();
int test_args();
int test_log_sinks();

int main() {
  int fails = 0;

  fails += test_hash();
  fails += test_random();
  fails += test_prompt();
  fails += test_palette();
  fails += test_canvas();
  fails += test_atmosphere();
  fails += test_scene_motif();
  fails += test_accents();
  fails += test_post_process();
  fails += test_placeholder();
  fails += test_scene_renderer();
  fails += test_image_generator();
  fails += test_generator_config();
  fails += test_cvars();
  fails += test_args();
  fails += test_log_sinks();

  if (fails == 0) {
    std::cout << "[promptart_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[promptart_tests] FAILS=" << fails << "\n";
  return 1;
}
